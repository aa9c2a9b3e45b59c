#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include "common/demand_helpers.hpp"
#include "tastecast/features/feature_builder.hpp"
#include "tastecast/models/probabilistic_regressor.hpp"

#include <algorithm>
#include <stdexcept>

using tastecast::core::Date;
using tastecast::features::FeatureBuilder;
using tastecast::models::ProbabilisticRegressorBuilder;

namespace {

tastecast::features::TrainingSet trainingData(std::size_t days = 120) {
	const auto series = tests::helpers::makeWeeklySeries(Date::fromYmd(2024, 1, 1), days);
	return FeatureBuilder::trainingSet(series);
}

} // namespace

TEST_CASE("Probabilistic regressor must be fit before use", "[models][probabilistic]") {
	auto model = ProbabilisticRegressorBuilder().build();
	REQUIRE(model->getName() == "ProbabilisticRidge");
	REQUIRE_FALSE(model->isFitted());
	const Eigen::MatrixXd row = Eigen::MatrixXd::Zero(1, 11);
	REQUIRE_THROWS_AS(model->predict(row), std::runtime_error);
	REQUIRE_THROWS_AS(model->predictInterval(row), std::runtime_error);
}

TEST_CASE("Probabilistic regressor builder validates settings", "[models][probabilistic][builder]") {
	REQUIRE_THROWS_AS(ProbabilisticRegressorBuilder().withPenalty(-0.5).build(), std::invalid_argument);
	REQUIRE_THROWS_AS(ProbabilisticRegressorBuilder().withPenaltyCandidates({1.0, -1.0}).build(),
	                  std::invalid_argument);
	REQUIRE_THROWS_AS(ProbabilisticRegressorBuilder().withCvSplits(1).build(), std::invalid_argument);
	REQUIRE_NOTHROW(ProbabilisticRegressorBuilder().withPenaltyCandidates({}).withCvSplits(1).build());
}

TEST_CASE("Intervals bracket point forecasts", "[models][probabilistic][interval]") {
	const auto training = trainingData();
	auto model = ProbabilisticRegressorBuilder().withSeed(7).build();
	model->fit(training.X, training.y);

	REQUIRE(model->residuals().size() == training.size());
	const Eigen::MatrixXd query = training.X.bottomRows(10);
	const Eigen::VectorXd point = model->predict(query);
	const auto interval = model->predictInterval(query, 0.05, 400);

	REQUIRE(interval.lower.size() == point.size());
	for (Eigen::Index i = 0; i < point.size(); ++i) {
		REQUIRE(interval.lower(i) <= interval.upper(i));
		REQUIRE(interval.lower(i) <= point(i) + 1e-9);
		REQUIRE(interval.upper(i) >= point(i) - 1e-9);
	}

	REQUIRE_THROWS_AS(model->predictInterval(query, 0.0, 100), std::invalid_argument);
	REQUIRE_THROWS_AS(model->predictInterval(query, 0.05, 0), std::invalid_argument);
}

TEST_CASE("Intervals are reproducible for a seed", "[models][probabilistic][interval]") {
	const auto training = trainingData();
	auto first = ProbabilisticRegressorBuilder().withSeed(11).build();
	auto second = ProbabilisticRegressorBuilder().withSeed(11).build();
	first->fit(training.X, training.y);
	second->fit(training.X, training.y);

	const Eigen::MatrixXd query = training.X.topRows(5);
	const auto a = first->predictInterval(query, 0.1, 200);
	const auto b = first->predictInterval(query, 0.1, 200);
	const auto c = second->predictInterval(query, 0.1, 200);
	REQUIRE(a.lower.isApprox(b.lower));
	REQUIRE(a.upper.isApprox(b.upper));
	REQUIRE(a.lower.isApprox(c.lower));
	REQUIRE(a.upper.isApprox(c.upper));
}

TEST_CASE("Wider alpha gives narrower intervals", "[models][probabilistic][interval]") {
	const auto training = trainingData();
	auto model = ProbabilisticRegressorBuilder().build();
	model->fit(training.X, training.y);

	const Eigen::MatrixXd query = training.X.topRows(1);
	const auto wide = model->predictInterval(query, 0.05, 500);
	const auto narrow = model->predictInterval(query, 0.5, 500);
	REQUIRE((wide.upper(0) - wide.lower(0)) >= (narrow.upper(0) - narrow.lower(0)));
}

TEST_CASE("Penalty is selected from the candidates", "[models][probabilistic][cv]") {
	const auto training = trainingData();
	const std::vector<double> candidates {0.1, 0.3, 1.0, 3.0, 10.0};
	auto model = ProbabilisticRegressorBuilder().withPenaltyCandidates(candidates).build();
	model->fit(training.X, training.y);

	REQUIRE(model->penaltySearch().has_value());
	const auto &search = *model->penaltySearch();
	REQUIRE(search.mean_mae.size() == candidates.size());
	REQUIRE(std::find(candidates.begin(), candidates.end(), model->selectedPenalty()) != candidates.end());

	const auto best = std::min_element(search.mean_mae.begin(), search.mean_mae.end());
	REQUIRE(search.best_penalty == candidates[static_cast<std::size_t>(best - search.mean_mae.begin())]);
}

TEST_CASE("Too few rows keep the default penalty", "[models][probabilistic][cv]") {
	const auto training = trainingData(33);
	REQUIRE(training.size() == 5);

	auto model = ProbabilisticRegressorBuilder().withPenalty(1.0).withCvSplits(5).build();
	model->fit(training.X, training.y);
	REQUIRE_FALSE(model->penaltySearch().has_value());
	REQUIRE(model->selectedPenalty() == 1.0);

	auto no_search = ProbabilisticRegressorBuilder().withPenalty(2.5).withPenaltyCandidates({}).build();
	no_search->fit(trainingData().X, trainingData().y);
	REQUIRE(no_search->selectedPenalty() == 2.5);
}
