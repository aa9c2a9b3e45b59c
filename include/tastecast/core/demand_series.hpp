#pragma once

#include "tastecast/core/date.hpp"

#include <cstddef>
#include <optional>
#include <stdexcept>
#include <vector>

namespace tastecast::core {

/**
 * @class DemandSeries
 * @brief Daily units sold, one value per calendar day.
 *
 * Dates and quantities are stored in separate vectors for cache-efficient
 * numerical processing. The constructor guarantees strictly ascending dates
 * (no duplicates) and non-negative, finite quantities.
 */
class DemandSeries {
public:
	using Value = double;

	DemandSeries() = default;

	/**
	 * @brief Constructs a DemandSeries object.
	 * @param dates Calendar days, strictly ascending.
	 * @param quantities Units sold on each day.
	 * @throws std::invalid_argument If sizes differ, dates are not strictly ascending or a quantity is negative.
	 */
	DemandSeries(std::vector<Date> dates, std::vector<Value> quantities);

	const std::vector<Date> &getDates() const {
		return dates_;
	}

	const std::vector<Value> &getQuantities() const {
		return quantities_;
	}

	std::size_t size() const {
		return dates_.size();
	}

	bool empty() const {
		return dates_.empty();
	}

	const Date &dateAt(std::size_t index) const {
		return dates_.at(index);
	}

	Value quantityAt(std::size_t index) const {
		return quantities_.at(index);
	}

	/// Last recorded day, or nullopt for an empty series.
	std::optional<Date> lastDate() const {
		if (dates_.empty()) {
			return std::nullopt;
		}
		return dates_.back();
	}

	/// Returns the half-open index range [begin, end) as a new series.
	DemandSeries slice(std::size_t begin, std::size_t end) const;

	/// Number of calendar days missing between the first and last date.
	std::size_t countMissingDays() const;

private:
	void validate() const;

	std::vector<Date> dates_;
	std::vector<Value> quantities_;
};

} // namespace tastecast::core
