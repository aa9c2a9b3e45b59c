#pragma once

#include "tastecast/config/pipeline_config.hpp"
#include "tastecast/core/demand_series.hpp"
#include "tastecast/core/forecast.hpp"
#include "tastecast/features/feature_builder.hpp"
#include "tastecast/io/demand_csv.hpp"
#include "tastecast/models/probabilistic_regressor.hpp"
#include "tastecast/scheduling/specials_scheduler.hpp"
#include "tastecast/utils/metrics.hpp"

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace tastecast::pipeline {

/// One-step accuracy on the most recent training rows.
struct HoldoutReport {
	std::size_t train_rows = 0;
	std::size_t test_rows = 0;
	double penalty = 0.0;
	utils::AccuracyMetrics metrics;
};

struct PipelineResult {
	std::size_t training_rows = 0;
	double selected_penalty = 0.0;
	std::optional<HoldoutReport> holdout;
	std::vector<core::ForecastRecord> forecast;
	scheduling::ScheduleResult schedule;
};

/**
 * @class Pipeline
 * @brief History in, forecast, plan and advisories out.
 *
 * Stages: training features, optional hold-out evaluation, model fit on all
 * complete rows, walk-forward forecast, specials scheduling.
 */
class Pipeline {
public:
	explicit Pipeline(config::PipelineConfig config);

	/**
	 * @brief Runs on a loaded CSV table.
	 *
	 * Ingredients without a configured start stock begin with the last closing
	 * stock recorded in the table, when it has one.
	 */
	PipelineResult run(const io::DemandTable &table) const;

	/**
	 * @throws std::invalid_argument If @p history is empty or has no row with a complete feature window.
	 */
	PipelineResult run(const core::DemandSeries &history, const std::map<std::string, int> &observed_stock = {}) const;

	/// Builds and fits the regressor configured by the "forecast" section.
	std::unique_ptr<models::ProbabilisticRegressor> fitModel(const features::TrainingSet &training) const;

	/// Hold-out evaluation, or nullopt when disabled or there are too few rows.
	std::optional<HoldoutReport> evaluateHoldout(const features::TrainingSet &training) const;

	const config::PipelineConfig &config() const {
		return config_;
	}

	static constexpr std::size_t kSeasonalPeriod = 7;

private:
	config::PipelineConfig config_;
};

} // namespace tastecast::pipeline
