#pragma once

#include "tastecast/core/date.hpp"

#include <optional>
#include <string>
#include <vector>

namespace tastecast::core {

/// Point forecast with its prediction interval.
struct Prediction {
	double mean = 0.0;
	double lower = 0.0;
	double upper = 0.0;
};

/**
 * @struct ForecastRecord
 * @brief One forecast day.
 *
 * @c qty_sold is the point forecast clipped to a non-negative integer. When the
 * interval could not be estimated, @c pred_lower and @c pred_upper equal
 * @c pred_mean and @c interval_ok is false.
 */
struct ForecastRecord {
	Date date;
	int qty_sold = 0;
	double pred_mean = 0.0;
	double pred_lower = 0.0;
	double pred_upper = 0.0;
	bool interval_ok = false;

	Prediction prediction() const {
		return Prediction {pred_mean, pred_lower, pred_upper};
	}
};

/**
 * @struct PlanDay
 * @brief A forecast day after the scheduler applied specials.
 *
 * @c needs and @c shortfall are aligned with the ingredient order of the plan.
 */
struct PlanDay {
	Date date;
	int qty_sold = 0;
	std::optional<Prediction> prediction;
	int qty_total = 0;
	int special_added = 0;
	std::vector<double> needs;
	std::vector<int> shortfall;

	/// Starts a plan day from a forecast record, with @c qty_total equal to the forecast.
	static PlanDay fromForecast(const ForecastRecord &record) {
		PlanDay day;
		day.date = record.date;
		day.qty_sold = record.qty_sold;
		day.prediction = record.prediction();
		day.qty_total = record.qty_sold;
		return day;
	}
};

/// Adjusted daily plan together with the ingredient names its columns refer to.
struct Plan {
	std::vector<std::string> ingredients;
	std::vector<PlanDay> days;

	/// Whether any day carries prediction columns.
	bool hasPredictions() const {
		for (const auto &day : days) {
			if (day.prediction) {
				return true;
			}
		}
		return false;
	}
};

enum class AdvisoryKind {
	Buy,
	Special
};

/**
 * @struct Advisory
 * @brief An operator-facing purchase or promotion instruction.
 *
 * @c type is "BUY_<ING>" or "SPECIAL_<ING>" with the ingredient upper-cased. BUY
 * advisories carry @c qty, SPECIAL advisories carry @c special_qty and the
 * comma-joined menu @c suggestions.
 */
struct Advisory {
	Date date;
	AdvisoryKind kind = AdvisoryKind::Buy;
	std::string type;
	std::string ingredient;
	std::optional<int> qty;
	std::optional<int> special_qty;
	std::optional<std::string> suggestions;
	std::string message;
	std::string reason;
	std::optional<Prediction> prediction;
	std::optional<std::string> pred_summary;
};

} // namespace tastecast::core
