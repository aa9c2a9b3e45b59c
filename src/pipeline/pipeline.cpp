#include "tastecast/pipeline/pipeline.hpp"
#include "tastecast/forecasting/window_generator.hpp"
#include "tastecast/utils/logging.hpp"

#include <stdexcept>

namespace tastecast::pipeline {

Pipeline::Pipeline(config::PipelineConfig config) : config_(std::move(config)) {
}

std::unique_ptr<models::ProbabilisticRegressor> Pipeline::fitModel(const features::TrainingSet &training) const {
	const auto &settings = config_.forecast();
	auto model = models::ProbabilisticRegressorBuilder()
	                 .withPenaltyCandidates(settings.penalties)
	                 .withCvSplits(settings.cv_splits)
	                 .withSeed(settings.seed)
	                 .build();
	model->fit(training.X, training.y);
	return model;
}

std::optional<HoldoutReport> Pipeline::evaluateHoldout(const features::TrainingSet &training) const {
	const auto holdout = static_cast<std::size_t>(config_.forecast().holdout_days);
	if (holdout == 0) {
		return std::nullopt;
	}
	if (training.size() < holdout + 2) {
		TASTECAST_WARN("Skipping hold-out evaluation: {} training rows cannot hold out {} days.", training.size(),
		               holdout);
		return std::nullopt;
	}

	const auto head = static_cast<Eigen::Index>(training.size() - holdout);
	const auto tail = static_cast<Eigen::Index>(holdout);

	features::TrainingSet fit_rows;
	fit_rows.X = training.X.topRows(head);
	fit_rows.y = training.y.head(head);
	const auto model = fitModel(fit_rows);

	HoldoutReport report;
	report.train_rows = static_cast<std::size_t>(head);
	report.test_rows = holdout;
	report.penalty = model->selectedPenalty();
	report.metrics = model->score(training.X.bottomRows(tail), training.y.tail(tail), fit_rows.y, kSeasonalPeriod);

	TASTECAST_INFO("Hold-out ({} days): MAE={:.3f} sMAPE={} MASE={}", holdout, report.metrics.mae,
	               report.metrics.smape ? std::to_string(*report.metrics.smape) : "n/a",
	               report.metrics.mase ? std::to_string(*report.metrics.mase) : "n/a");
	return report;
}

PipelineResult Pipeline::run(const io::DemandTable &table) const {
	return run(table.series, io::lastEndingStock(table, config_.production().recipe.ingredients()));
}

PipelineResult Pipeline::run(const core::DemandSeries &history, const std::map<std::string, int> &observed_stock) const {
	if (history.empty()) {
		throw std::invalid_argument("Demand history is empty.");
	}

	const auto training = features::FeatureBuilder::trainingSet(history);
	if (training.size() == 0) {
		throw std::invalid_argument("No training rows: the history needs more than " +
		                            std::to_string(features::kLongWindow) + " days.");
	}

	PipelineResult result;
	result.training_rows = training.size();
	result.holdout = evaluateHoldout(training);

	const auto model = fitModel(training);
	result.selected_penalty = model->selectedPenalty();
	TASTECAST_INFO("Fitted {} on {} rows (penalty {}).", model->getName(), training.size(), result.selected_penalty);

	const forecasting::ForecastWindowGenerator generator(config_.forecastConfig());
	result.forecast = generator.generate(history, *model);

	const scheduling::SpecialsScheduler scheduler(config_.schedulerConfig(observed_stock));
	result.schedule = scheduler.schedule(result.forecast);
	return result;
}

} // namespace tastecast::pipeline
