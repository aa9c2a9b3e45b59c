#pragma once

#include "tastecast/core/date.hpp"
#include "tastecast/core/demand_series.hpp"
#include "tastecast/core/forecast.hpp"
#include "tastecast/models/iregressor.hpp"

#include <optional>
#include <vector>

namespace tastecast::forecasting {

/**
 * @brief Configuration of a forecast window
 */
struct ForecastConfig {
	int days_ahead = 30;              // Requested horizon in days
	std::optional<int> cutoff_year;   // Last forecast day is Dec 31 of this year (default: first forecast year)
	double alpha = 0.05;              // Interval tail probability
	int n_boot = 500;                 // Bootstrap draws per interval
};

/// First and last day of a forecast window (inclusive).
struct ForecastWindow {
	core::Date start;
	core::Date end;

	bool empty() const {
		return end < start;
	}

	std::size_t days() const {
		return empty() ? 0 : static_cast<std::size_t>(end - start) + 1;
	}
};

/**
 * @class ForecastWindowGenerator
 * @brief Walk-forward multi-day forecasting with a fitted regressor.
 *
 * Each forecast day is appended to a working copy of the history before the
 * next day's features are computed, so lag and rolling features of later days
 * are built from earlier forecasts. The steps are strictly sequential.
 */
class ForecastWindowGenerator {
public:
	explicit ForecastWindowGenerator(ForecastConfig config = {});

	/**
	 * @brief Start and end of the window that follows @p history.
	 * @throws std::invalid_argument If @p history is empty.
	 */
	ForecastWindow window(const core::DemandSeries &history) const;

	/**
	 * @brief Forecasts every day of window(history).
	 *
	 * Interval bounds are requested when @p model implements IIntervalRegressor.
	 * A failed interval for one day is logged and recorded as degenerate
	 * (lower == upper == mean) without stopping the walk.
	 *
	 * @throws std::invalid_argument If @p history is empty.
	 * @throws std::runtime_error If @p model is not fitted.
	 */
	std::vector<core::ForecastRecord> generate(const core::DemandSeries &history,
	                                           const models::IRegressor &model) const;

	const ForecastConfig &config() const {
		return config_;
	}

	/// Clips a point forecast to a non-negative integer, rounding half to even.
	static int clipToUnits(double value);

private:
	ForecastConfig config_;
};

} // namespace tastecast::forecasting
