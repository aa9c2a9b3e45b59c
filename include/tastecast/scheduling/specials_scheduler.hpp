#pragma once

#include "tastecast/core/date.hpp"
#include "tastecast/core/forecast.hpp"
#include "tastecast/inventory/recipe.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace tastecast::scheduling {

/**
 * @brief Inputs of a scheduling run other than the plan itself
 *
 * Weekdays are indices with Monday = 0. Ingredient-keyed maps may only name
 * recipe ingredients; missing entries mean stock 0, no lot rounding and the
 * default shelf life respectively.
 */
struct SchedulerConfig {
	inventory::Recipe recipe;
	std::vector<int> special_days;
	int max_boost_per_day = 0;
	std::map<std::string, int> start_stock;
	std::map<std::string, int> lot_sizes;
	std::optional<int> vendor_weekday;
	double service_level = 0.95;
	int lead_time_days = 2;
	std::map<std::string, int> shelf_life_days;
	std::uint64_t suggestion_seed = 0;
	std::size_t suggestion_count = 5;

	static constexpr int kDefaultShelfLifeDays = 3;
	static constexpr std::size_t kHistoryWindow = 28;

	/**
	 * @throws std::invalid_argument On an empty recipe, unknown ingredient keys, a negative
	 * cap or start stock, a non-positive lead time, an out-of-range weekday or service level.
	 */
	void validate() const;

	int shelfLife(const std::string &ingredient) const;
};

/// Reorder evaluation of one ingredient on one vendor day.
struct RestockCheck {
	core::Date date;
	std::string ingredient;
	int stock_before = 0;
	double avg_daily = 0.0;
	double safety = 0.0;
	double reorder_point = 0.0;
	double target = 0.0;
	int ordered = 0;

	bool belowReorderPoint() const {
		return static_cast<double>(stock_before) < reorder_point;
	}
};

/// Surplus evaluation of one ingredient on one special day.
struct SurplusCheck {
	core::Date date;
	std::string ingredient;
	int stock = 0;
	int future_need = 0;
	double safety = 0.0;
	double surplus = 0.0;
	int capacity_left = 0;
	int added = 0;
};

struct ScheduleResult {
	core::Plan plan;
	std::vector<core::Advisory> advisories;
	std::vector<RestockCheck> restock_checks;
	std::vector<SurplusCheck> surplus_checks;

	std::size_t countAdvisories(core::AdvisoryKind kind) const;
};

/**
 * @class SpecialsScheduler
 * @brief Day-by-day inventory simulation with vendor restocks and surplus-burning promotions.
 *
 * Each day runs three steps in order:
 * 1. On the vendor weekday, every ingredient whose stock is below its reorder
 *    point gets one lot-rounded BUY that covers the lead-time demand plus
 *    safety stock and one item.
 * 2. The day's baseline demand is consumed from stock.
 * 3. On special weekdays, ingredients with a positive surplus over the demand
 *    until they expire are promoted, largest surplus first, until the daily
 *    promotion cap is used up.
 *
 * Demand statistics always come from the plan as it was passed in, before any
 * promotion was added. Stock is floored at zero; units that could not be served
 * are reported per ingredient in the plan's shortfall column.
 */
class SpecialsScheduler {
public:
	/// @throws std::invalid_argument If @p config fails SchedulerConfig::validate().
	explicit SpecialsScheduler(SchedulerConfig config);

	/// Schedules a plan; days are processed in date order.
	ScheduleResult schedule(std::vector<core::PlanDay> days) const;

	/// Schedules a plan seeded from forecast records.
	ScheduleResult schedule(const std::vector<core::ForecastRecord> &forecast) const;

	const SchedulerConfig &config() const {
		return config_;
	}

	/// "Pred m (l-u)" with one decimal.
	static std::string formatPredictionSummary(const core::Prediction &prediction);

private:
	SchedulerConfig config_;
};

} // namespace tastecast::scheduling
