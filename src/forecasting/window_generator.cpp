#include "tastecast/forecasting/window_generator.hpp"
#include "tastecast/features/feature_builder.hpp"
#include "tastecast/utils/logging.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace tastecast::forecasting {

ForecastWindowGenerator::ForecastWindowGenerator(ForecastConfig config) : config_(config) {
	if (!(config_.alpha > 0.0 && config_.alpha < 1.0)) {
		throw std::invalid_argument("Interval alpha must be in (0, 1).");
	}
	if (config_.n_boot < 1) {
		throw std::invalid_argument("Bootstrap sample count must be positive.");
	}
}

int ForecastWindowGenerator::clipToUnits(double value) {
	if (!std::isfinite(value) || value <= 0.0) {
		return 0;
	}
	// nearbyint honours the default FE_TONEAREST mode: halves go to the even neighbour
	return static_cast<int>(std::nearbyint(value));
}

ForecastWindow ForecastWindowGenerator::window(const core::DemandSeries &history) const {
	const auto last = history.lastDate();
	if (!last) {
		throw std::invalid_argument("Cannot forecast from an empty history.");
	}

	ForecastWindow bounds;
	bounds.start = *last + 1;
	const int cutoff_year = config_.cutoff_year.value_or(bounds.start.year());
	const auto cutoff = core::Date::fromYmd(cutoff_year, 12, 31);
	bounds.end = std::min(bounds.start + (config_.days_ahead - 1), cutoff);
	return bounds;
}

std::vector<core::ForecastRecord> ForecastWindowGenerator::generate(const core::DemandSeries &history,
                                                                    const models::IRegressor &model) const {
	const auto bounds = window(history);
	if (!model.isFitted()) {
		throw std::runtime_error("Forecast window requires a fitted model.");
	}

	if (config_.days_ahead > 0 && bounds.days() < static_cast<std::size_t>(config_.days_ahead)) {
		TASTECAST_WARN("Forecast horizon cut to {} of {} requested days by the {} cutoff; set forecast.cutoff_year "
		               "to extend it.",
		               bounds.days(), config_.days_ahead, bounds.end.year());
	}

	std::vector<core::ForecastRecord> records;
	if (bounds.empty()) {
		TASTECAST_INFO("Forecast window is empty (days_ahead={}).", config_.days_ahead);
		return records;
	}
	records.reserve(bounds.days());

	const auto *interval_model = dynamic_cast<const models::IIntervalRegressor *>(&model);
	TASTECAST_INFO("Forecasting {} days from {} to {} with {}{}.", bounds.days(), bounds.start.toString(),
	               bounds.end.toString(), model.getName(), interval_model ? " (with intervals)" : "");

	features::DemandAccumulator working(history);
	Eigen::MatrixXd row(1, static_cast<Eigen::Index>(features::kFeatureCount));

	std::size_t interval_failures = 0;
	for (auto day = bounds.start; day <= bounds.end; day += 1) {
		const auto values = working.nextFeatures(day).forecastValues();
		for (std::size_t c = 0; c < features::kFeatureCount; ++c) {
			row(0, static_cast<Eigen::Index>(c)) = values[c];
		}

		core::ForecastRecord record;
		record.date = day;
		record.pred_mean = model.predict(row)(0);
		record.pred_lower = record.pred_mean;
		record.pred_upper = record.pred_mean;

		if (interval_model != nullptr) {
			try {
				const auto interval = interval_model->predictInterval(row, config_.alpha, config_.n_boot);
				// Bootstrap quantiles may sit on one side of the mean for skewed residuals
				record.pred_lower = std::min(interval.lower(0), record.pred_mean);
				record.pred_upper = std::max(interval.upper(0), record.pred_mean);
				record.interval_ok = true;
			} catch (const std::exception &e) {
				++interval_failures;
				TASTECAST_WARN("Interval estimation failed for {}: {}. Using a degenerate interval.",
				               day.toString(), e.what());
			}
		}

		record.qty_sold = clipToUnits(record.pred_mean);
		working.append(day, static_cast<double>(record.qty_sold));
		records.push_back(record);
	}

	if (interval_failures > 0) {
		TASTECAST_WARN("{} of {} forecast days have degenerate intervals.", interval_failures, records.size());
	}
	return records;
}

} // namespace tastecast::forecasting
