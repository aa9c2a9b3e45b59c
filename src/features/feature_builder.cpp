#include "tastecast/features/feature_builder.hpp"
#include "tastecast/utils/logging.hpp"

#include <algorithm>
#include <stdexcept>

namespace tastecast::features {

namespace {

// Mean of the last min(window, t) values before position t, using prefix sums.
std::optional<double> trailingMean(const std::vector<double> &prefix, std::size_t t, std::size_t window) {
	const std::size_t count = std::min(window, t);
	if (count == 0) {
		return std::nullopt;
	}
	return (prefix[t] - prefix[t - count]) / static_cast<double>(count);
}

std::optional<double> lagAt(const std::vector<double> &values, std::size_t t, std::size_t lag) {
	if (t < lag) {
		return std::nullopt;
	}
	return values[t - lag];
}

FeatureRow featuresAt(const core::Date &date, const std::vector<double> &values, const std::vector<double> &prefix,
                      std::size_t t) {
	FeatureRow row = FeatureBuilder::calendarFeatures(date);
	row.lag_1 = lagAt(values, t, 1);
	row.lag_7 = lagAt(values, t, kShortWindow);
	row.roll7 = trailingMean(prefix, t, kShortWindow);
	row.roll28 = trailingMean(prefix, t, kLongWindow);
	row.complete = t >= kLongWindow;
	return row;
}

} // namespace

const std::array<std::string, kFeatureCount> &featureNames() {
	static const std::array<std::string, kFeatureCount> names {
	    "dow", "month", "is_weekend", "is_xmas", "is_july4", "is_piday", "is_thanksgiving",
	    "lag_1", "lag_7", "roll7", "roll28"};
	return names;
}

core::Date thanksgivingDay(int year) {
	const auto first = core::Date::fromYmd(year, 11, 1);
	// Thursday is weekday 3.
	const int offset = (3 - first.weekday() + 7) % 7;
	return first + offset + 21;
}

bool isThanksgiving(const core::Date &date) {
	return date.month() == 11 && date == thanksgivingDay(date.year());
}

std::array<double, kFeatureCount> FeatureRow::trainingValues() const {
	if (!complete || !lag_1 || !lag_7 || !roll7 || !roll28) {
		throw std::invalid_argument("Feature row for " + date.toString() + " lacks full lag history.");
	}
	return {static_cast<double>(dow),        static_cast<double>(month),   static_cast<double>(is_weekend),
	        static_cast<double>(is_xmas),    static_cast<double>(is_july4), static_cast<double>(is_piday),
	        static_cast<double>(is_thanksgiving), *lag_1, *lag_7, *roll7, *roll28};
}

std::array<double, kFeatureCount> FeatureRow::forecastValues() const {
	const double fallback = roll7.value_or(0.0);
	return {static_cast<double>(dow),
	        static_cast<double>(month),
	        static_cast<double>(is_weekend),
	        static_cast<double>(is_xmas),
	        static_cast<double>(is_july4),
	        static_cast<double>(is_piday),
	        static_cast<double>(is_thanksgiving),
	        lag_1.value_or(fallback),
	        lag_7.value_or(fallback),
	        roll7.value_or(0.0),
	        roll28.value_or(0.0)};
}

FeatureRow FeatureBuilder::calendarFeatures(const core::Date &date) {
	FeatureRow row;
	row.date = date;
	row.dow = date.weekday();
	row.month = date.month();
	const int day = date.day();
	row.is_weekend = row.dow >= 5 ? 1 : 0;
	row.is_xmas = (row.month == 12 && day == 25) ? 1 : 0;
	row.is_july4 = (row.month == 7 && day == 4) ? 1 : 0;
	row.is_piday = (row.month == 3 && day == 14) ? 1 : 0;
	row.is_thanksgiving = isThanksgiving(date) ? 1 : 0;
	return row;
}

std::vector<FeatureRow> FeatureBuilder::build(const core::DemandSeries &series) {
	const auto &values = series.getQuantities();
	const auto &dates = series.getDates();

	std::vector<double> prefix(values.size() + 1, 0.0);
	for (std::size_t i = 0; i < values.size(); ++i) {
		prefix[i + 1] = prefix[i] + values[i];
	}

	std::vector<FeatureRow> rows;
	rows.reserve(values.size());
	for (std::size_t t = 0; t < values.size(); ++t) {
		rows.push_back(featuresAt(dates[t], values, prefix, t));
	}
	return rows;
}

TrainingSet FeatureBuilder::trainingSet(const core::DemandSeries &series) {
	const auto rows = build(series);

	TrainingSet set;
	for (std::size_t t = 0; t < rows.size(); ++t) {
		if (rows[t].complete) {
			set.source_rows.push_back(t);
			set.dates.push_back(rows[t].date);
		}
	}

	const auto n = static_cast<Eigen::Index>(set.source_rows.size());
	set.X.resize(n, static_cast<Eigen::Index>(kFeatureCount));
	set.y.resize(n);
	for (Eigen::Index r = 0; r < n; ++r) {
		const auto source = set.source_rows[static_cast<std::size_t>(r)];
		const auto values = rows[source].trainingValues();
		for (std::size_t c = 0; c < kFeatureCount; ++c) {
			set.X(r, static_cast<Eigen::Index>(c)) = values[c];
		}
		set.y(r) = series.quantityAt(source);
	}

	TASTECAST_DEBUG("Built {} training rows from {} records ({} dropped for short history).", set.size(),
	                series.size(), series.size() - set.size());
	return set;
}

DemandAccumulator::DemandAccumulator(const core::DemandSeries &history) {
	values_.reserve(history.size());
	prefix_.reserve(history.size() + 1);
	for (std::size_t i = 0; i < history.size(); ++i) {
		values_.push_back(history.quantityAt(i));
		prefix_.push_back(prefix_.back() + history.quantityAt(i));
	}
	last_date_ = history.lastDate();
}

void DemandAccumulator::append(const core::Date &date, double value) {
	if (last_date_ && date <= *last_date_) {
		throw std::invalid_argument("Accumulator dates must be strictly ascending.");
	}
	if (value < 0.0) {
		throw std::invalid_argument("Accumulated demand must be non-negative.");
	}
	values_.push_back(value);
	prefix_.push_back(prefix_.back() + value);
	last_date_ = date;
}

FeatureRow DemandAccumulator::nextFeatures(const core::Date &date) const {
	return featuresAt(date, values_, prefix_, values_.size());
}

} // namespace tastecast::features
