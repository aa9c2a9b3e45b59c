#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace tastecast::inventory {

/**
 * @brief Reorder and safety-stock arithmetic
 *
 * Stateless helpers shared by the specials scheduler. Demand figures are per
 * day and in the same unit (items or ingredient units) as the result.
 */

/// A weekday given either as 0 (Monday) ... 6 (Sunday) or by name ("Mon", "thursday").
using WeekdaySpec = std::variant<int, std::string>;

/**
 * @brief Standard normal quantile for a target service level.
 * @param service_level Probability of not stocking out, in (0, 1).
 * @throws std::invalid_argument If the level is outside (0, 1).
 */
double zFromServiceLevel(double service_level);

/**
 * @brief Safety stock = z(service_level) * daily_demand_std * sqrt(lead_time_days), floored at 0.
 */
double safetyStock(double daily_demand_std, int lead_time_days, double service_level);

/**
 * @brief Reorder point = avg_daily_demand * lead_time_days + safety_stock.
 */
double reorderPoint(double avg_daily_demand, int lead_time_days, double safety_stock);

/**
 * @brief Rounds @p qty up to the next multiple of @p lot_size.
 *
 * A non-positive lot size means no lot rounding: the quantity is rounded up to
 * the next integer.
 */
int roundUpLot(double qty, int lot_size);

/// Parses one weekday; unrecognized values yield nullopt.
std::optional<int> parseWeekday(const WeekdaySpec &day);

/// Recognized weekdays, de-duplicated and sorted ascending.
std::vector<int> normalizeWeekdays(const std::vector<WeekdaySpec> &days);

/// Three-letter name of a weekday index ("Mon" ... "Sun").
std::string weekdayName(int weekday);

/**
 * @brief Trailing rolling standard deviation with a fallback for degenerate windows.
 *
 * Each output value is the sample standard deviation of the last @p window
 * values up to and including that position (shorter windows at the start).
 * Where it is undefined or below 1e-6, 25% of the window mean is used instead,
 * and 1.0 when that is zero too, so safety-stock math never sees a zero
 * volatility estimate.
 */
std::vector<double> rollingStdProxy(const std::vector<double> &values, std::size_t window = 7);

} // namespace tastecast::inventory
