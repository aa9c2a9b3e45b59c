#pragma once

#include "tastecast/core/date.hpp"
#include "tastecast/core/demand_series.hpp"

#include <Eigen/Dense>
#include <array>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace tastecast::features {

/// Number of model inputs per day.
constexpr std::size_t kFeatureCount = 11;

/// Longest trailing window; training rows need this many prior observations.
constexpr std::size_t kLongWindow = 28;
constexpr std::size_t kShortWindow = 7;

/// Column names in model input order.
const std::array<std::string, kFeatureCount> &featureNames();

/// Fourth Thursday of November of @p year.
core::Date thanksgivingDay(int year);

/// True when @p date is the US Thanksgiving of its year.
bool isThanksgiving(const core::Date &date);

/**
 * @struct FeatureRow
 * @brief Calendar and autoregressive inputs for one day.
 *
 * Lag and rolling values are computed from strictly earlier days. A rolling mean
 * is defined as soon as one prior day exists (partial window); lags stay empty
 * until enough history exists. @c complete marks rows with at least
 * kLongWindow prior observations, which is what training requires.
 */
struct FeatureRow {
	core::Date date;
	int dow = 0;
	int month = 1;
	int is_weekend = 0;
	int is_xmas = 0;
	int is_july4 = 0;
	int is_piday = 0;
	int is_thanksgiving = 0;
	std::optional<double> lag_1;
	std::optional<double> lag_7;
	std::optional<double> roll7;
	std::optional<double> roll28;
	bool complete = false;

	/**
	 * @brief Model inputs for training.
	 * @throws std::invalid_argument If the row lacks full history.
	 */
	std::array<double, kFeatureCount> trainingValues() const;

	/**
	 * @brief Model inputs for walk-forward prediction.
	 *
	 * An undefined lag is replaced by the partial 7-day mean, or 0 when there is
	 * no history at all.
	 */
	std::array<double, kFeatureCount> forecastValues() const;
};

/// Complete rows arranged for model fitting.
struct TrainingSet {
	Eigen::MatrixXd X;
	Eigen::VectorXd y;
	std::vector<core::Date> dates;
	/// Index of each training row in the source series.
	std::vector<std::size_t> source_rows;

	std::size_t size() const {
		return dates.size();
	}
};

/**
 * @class FeatureBuilder
 * @brief Derives calendar, lag and rolling-mean features from a demand series.
 */
class FeatureBuilder {
public:
	/// One feature row per record, in series order.
	static std::vector<FeatureRow> build(const core::DemandSeries &series);

	/**
	 * @brief Complete rows only; the first kLongWindow records are dropped, not imputed.
	 */
	static TrainingSet trainingSet(const core::DemandSeries &series);

	/// Calendar-only part of a feature row.
	static FeatureRow calendarFeatures(const core::Date &date);
};

/**
 * @class DemandAccumulator
 * @brief Append-only demand sequence with prefix sums for walk-forward forecasting.
 *
 * Computing the features of the next day costs O(1) regardless of how many days
 * have been appended.
 */
class DemandAccumulator {
public:
	DemandAccumulator() = default;
	explicit DemandAccumulator(const core::DemandSeries &history);

	/**
	 * @brief Appends the demand of the day following the last appended day.
	 * @throws std::invalid_argument If @p date is not after the last date or @p value is negative.
	 */
	void append(const core::Date &date, double value);

	/// Features of @p date computed from every appended value.
	FeatureRow nextFeatures(const core::Date &date) const;

	std::size_t size() const {
		return values_.size();
	}

	const std::vector<double> &values() const {
		return values_;
	}

	std::optional<core::Date> lastDate() const {
		return last_date_;
	}

private:
	std::vector<double> values_;
	std::vector<double> prefix_ {0.0};
	std::optional<core::Date> last_date_;
};

} // namespace tastecast::features
