#include "tastecast/core/demand_series.hpp"

#include <cmath>
#include <string>

namespace tastecast::core {

DemandSeries::DemandSeries(std::vector<Date> dates, std::vector<Value> quantities)
    : dates_(std::move(dates)), quantities_(std::move(quantities)) {
	if (dates_.size() != quantities_.size()) {
		throw std::invalid_argument("Dates and quantities vectors must have the same size.");
	}
	validate();
}

void DemandSeries::validate() const {
	for (std::size_t i = 0; i < quantities_.size(); ++i) {
		if (!std::isfinite(quantities_[i]) || quantities_[i] < 0.0) {
			throw std::invalid_argument("Quantity on " + dates_[i].toString() + " must be a non-negative number.");
		}
		if (i > 0 && dates_[i] <= dates_[i - 1]) {
			throw std::invalid_argument("Dates must be strictly ascending; offending date " + dates_[i].toString() +
			                            ".");
		}
	}
}

DemandSeries DemandSeries::slice(std::size_t begin, std::size_t end) const {
	if (begin > end || end > size()) {
		throw std::out_of_range("Slice bounds exceed series length.");
	}
	std::vector<Date> dates(dates_.begin() + static_cast<std::ptrdiff_t>(begin),
	                        dates_.begin() + static_cast<std::ptrdiff_t>(end));
	std::vector<Value> quantities(quantities_.begin() + static_cast<std::ptrdiff_t>(begin),
	                              quantities_.begin() + static_cast<std::ptrdiff_t>(end));
	return DemandSeries(std::move(dates), std::move(quantities));
}

std::size_t DemandSeries::countMissingDays() const {
	if (dates_.size() < 2) {
		return 0;
	}
	const auto span = static_cast<std::size_t>(dates_.back() - dates_.front()) + 1;
	return span - dates_.size();
}

} // namespace tastecast::core
