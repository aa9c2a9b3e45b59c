#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include "common/demand_helpers.hpp"
#include "tastecast/features/feature_builder.hpp"
#include "tastecast/forecasting/window_generator.hpp"
#include "tastecast/models/probabilistic_regressor.hpp"
#include "tastecast/utils/logging.hpp"

#include <spdlog/sinks/ringbuffer_sink.h>

#include <cmath>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

using tastecast::core::Date;
using tastecast::core::DemandSeries;
using tastecast::forecasting::ForecastConfig;
using tastecast::forecasting::ForecastWindowGenerator;
using namespace tastecast::models;

namespace {

// Predicts yesterday's demand plus a constant step.
class StepRegressor : public IRegressor {
public:
	explicit StepRegressor(double step) : step_(step) {
	}
	void fit(const Eigen::MatrixXd &, const Eigen::VectorXd &) override {
		fitted_ = true;
	}
	Eigen::VectorXd predict(const Eigen::MatrixXd &X) const override {
		Eigen::VectorXd result = X.col(7);
		result.array() += step_;
		return result;
	}
	bool isFitted() const override {
		return fitted_;
	}
	std::string getName() const override {
		return "Step";
	}

protected:
	double step_;
	bool fitted_ = false;
};

class BrokenIntervalRegressor final : public IIntervalRegressor {
public:
	void fit(const Eigen::MatrixXd &, const Eigen::VectorXd &) override {
	}
	Eigen::VectorXd predict(const Eigen::MatrixXd &X) const override {
		return Eigen::VectorXd::Constant(X.rows(), 4.4);
	}
	PredictionInterval predictInterval(const Eigen::MatrixXd &, double, int) const override {
		throw std::runtime_error("no residuals");
	}
	bool isFitted() const override {
		return true;
	}
	std::string getName() const override {
		return "BrokenInterval";
	}
};

// Interval entirely above the mean, as skewed bootstrap residuals can produce.
class SkewedIntervalRegressor final : public IIntervalRegressor {
public:
	void fit(const Eigen::MatrixXd &, const Eigen::VectorXd &) override {
	}
	Eigen::VectorXd predict(const Eigen::MatrixXd &X) const override {
		return Eigen::VectorXd::Constant(X.rows(), 5.0);
	}
	PredictionInterval predictInterval(const Eigen::MatrixXd &X, double, int) const override {
		return PredictionInterval {Eigen::VectorXd::Constant(X.rows(), 6.0), Eigen::VectorXd::Constant(X.rows(), 9.0)};
	}
	bool isFitted() const override {
		return true;
	}
	std::string getName() const override {
		return "Skewed";
	}
};

} // namespace

TEST_CASE("Forecast window starts the day after history", "[forecasting][window]") {
	const auto history = tests::helpers::makeSeries(Date::fromYmd(2025, 12, 1), {5.0, 6.0, 7.0});
	ForecastConfig config;
	config.days_ahead = 10;
	const auto window = ForecastWindowGenerator(config).window(history);
	REQUIRE(window.start == Date::fromYmd(2025, 12, 4));
	REQUIRE(window.end == Date::fromYmd(2025, 12, 13));
	REQUIRE(window.days() == 10);
}

TEST_CASE("Forecast window stops at the year-end cutoff", "[forecasting][window]") {
	const auto history = tests::helpers::makeSeries(Date::fromYmd(2025, 12, 20), {5.0});
	ForecastConfig config;
	config.days_ahead = 30;

	const auto same_year = ForecastWindowGenerator(config).window(history);
	REQUIRE(same_year.end == Date::fromYmd(2025, 12, 31));
	REQUIRE(same_year.days() == 11);

	config.cutoff_year = 2026;
	const auto next_year = ForecastWindowGenerator(config).window(history);
	REQUIRE(next_year.end == Date::fromYmd(2026, 1, 19));

	config.cutoff_year = 2024;
	REQUIRE(ForecastWindowGenerator(config).window(history).empty());
}

TEST_CASE("Truncated horizons are reported", "[forecasting][window][logging]") {
	auto sink = std::make_shared<spdlog::sinks::ringbuffer_sink_mt>(16);
	tastecast::utils::Logging::init(spdlog::level::info);
	auto &logger = tastecast::utils::Logging::getLogger();
	logger->sinks().push_back(sink);

	const auto history = tests::helpers::makeSeries(Date::fromYmd(2024, 12, 1), std::vector<double>(30, 6.0));
	ForecastConfig config;
	config.days_ahead = 60;
	StepRegressor model(0.0);
	model.fit(Eigen::MatrixXd(), Eigen::VectorXd());
	const auto records = ForecastWindowGenerator(config).generate(history, model);
	logger->sinks().pop_back();

	REQUIRE(records.size() == 1);
	REQUIRE(records.front().date == Date::fromYmd(2024, 12, 31));

	bool warned = false;
	for (const auto &line : sink->last_formatted()) {
		warned = warned || line.find("cut to 1 of 60 requested days") != std::string::npos;
	}
	REQUIRE(warned);
}

TEST_CASE("Forecast generator rejects bad inputs", "[forecasting][window]") {
	ForecastConfig bad_alpha;
	bad_alpha.alpha = 1.0;
	REQUIRE_THROWS_AS(ForecastWindowGenerator(bad_alpha), std::invalid_argument);

	ForecastConfig bad_boot;
	bad_boot.n_boot = 0;
	REQUIRE_THROWS_AS(ForecastWindowGenerator(bad_boot), std::invalid_argument);

	StepRegressor model(1.0);
	model.fit(Eigen::MatrixXd(), Eigen::VectorXd());
	REQUIRE_THROWS_AS(ForecastWindowGenerator().generate(DemandSeries(), model), std::invalid_argument);

	StepRegressor unfit(1.0);
	const auto history = tests::helpers::makeSeries(Date::fromYmd(2025, 1, 1), {1.0});
	REQUIRE_THROWS_AS(ForecastWindowGenerator().generate(history, unfit), std::runtime_error);
}

TEST_CASE("Walk-forward feeds forecasts back as lags", "[forecasting][walk]") {
	const auto history = tests::helpers::makeSeries(Date::fromYmd(2025, 1, 1), {3.0, 4.0, 5.0});
	StepRegressor model(1.0);
	model.fit(Eigen::MatrixXd(), Eigen::VectorXd());

	ForecastConfig config;
	config.days_ahead = 4;
	const auto records = ForecastWindowGenerator(config).generate(history, model);

	REQUIRE(records.size() == 4);
	REQUIRE(records[0].date == Date::fromYmd(2025, 1, 4));
	REQUIRE(records[0].qty_sold == 6);
	REQUIRE(records[1].qty_sold == 7);
	REQUIRE(records[3].qty_sold == 9);
	for (const auto &record : records) {
		REQUIRE_FALSE(record.interval_ok);
		REQUIRE(record.pred_lower == record.pred_mean);
		REQUIRE(record.pred_upper == record.pred_mean);
	}
}

TEST_CASE("Negative forecasts clip to zero", "[forecasting][walk]") {
	const auto history = tests::helpers::makeSeries(Date::fromYmd(2025, 1, 1), {1.0});
	StepRegressor model(-3.0);
	model.fit(Eigen::MatrixXd(), Eigen::VectorXd());

	ForecastConfig config;
	config.days_ahead = 3;
	const auto records = ForecastWindowGenerator(config).generate(history, model);
	REQUIRE(records[0].pred_mean == Catch::Approx(-2.0));
	for (const auto &record : records) {
		REQUIRE(record.qty_sold == 0);
	}
}

TEST_CASE("Clipping rounds half to even", "[forecasting][walk]") {
	REQUIRE(ForecastWindowGenerator::clipToUnits(2.5) == 2);
	REQUIRE(ForecastWindowGenerator::clipToUnits(3.5) == 4);
	REQUIRE(ForecastWindowGenerator::clipToUnits(3.49) == 3);
	REQUIRE(ForecastWindowGenerator::clipToUnits(-0.4) == 0);
	REQUIRE(ForecastWindowGenerator::clipToUnits(std::nan("")) == 0);
}

TEST_CASE("Zero horizon yields an empty forecast", "[forecasting][window]") {
	const auto history = tests::helpers::makeSeries(Date::fromYmd(2025, 1, 1), {1.0});
	StepRegressor model(1.0);
	model.fit(Eigen::MatrixXd(), Eigen::VectorXd());
	ForecastConfig config;
	config.days_ahead = 0;
	REQUIRE(ForecastWindowGenerator(config).generate(history, model).empty());
}

TEST_CASE("Interval failures degrade to point intervals", "[forecasting][interval]") {
	const auto history = tests::helpers::makeSeries(Date::fromYmd(2025, 1, 1), {1.0, 2.0});
	BrokenIntervalRegressor model;
	ForecastConfig config;
	config.days_ahead = 3;
	const auto records = ForecastWindowGenerator(config).generate(history, model);

	REQUIRE(records.size() == 3);
	for (const auto &record : records) {
		REQUIRE_FALSE(record.interval_ok);
		REQUIRE(record.pred_lower == Catch::Approx(4.4));
		REQUIRE(record.pred_upper == Catch::Approx(4.4));
		REQUIRE(record.qty_sold == 4);
	}
}

TEST_CASE("Intervals are widened to contain the mean", "[forecasting][interval]") {
	const auto history = tests::helpers::makeSeries(Date::fromYmd(2025, 1, 1), {1.0});
	SkewedIntervalRegressor model;
	ForecastConfig config;
	config.days_ahead = 2;
	const auto records = ForecastWindowGenerator(config).generate(history, model);

	REQUIRE(records[0].interval_ok);
	REQUIRE(records[0].pred_lower == Catch::Approx(5.0));
	REQUIRE(records[0].pred_upper == Catch::Approx(9.0));
}

TEST_CASE("Fitted regressor forecasts a full window", "[forecasting][integration]") {
	const auto start = Date::fromYmd(2025, 1, 1);
	const auto history = tests::helpers::makeWeeklySeries(start, 120);
	const auto training = tastecast::features::FeatureBuilder::trainingSet(history);
	auto model = ProbabilisticRegressorBuilder().withSeed(3).build();
	model->fit(training.X, training.y);

	ForecastConfig config;
	config.days_ahead = 21;
	const ForecastWindowGenerator generator(config);
	const auto first = generator.generate(history, *model);
	const auto second = generator.generate(history, *model);

	REQUIRE(first.size() == 21);
	for (std::size_t i = 0; i < first.size(); ++i) {
		REQUIRE(first[i].interval_ok);
		REQUIRE(first[i].pred_lower <= first[i].pred_mean);
		REQUIRE(first[i].pred_mean <= first[i].pred_upper);
		REQUIRE(first[i].qty_sold >= 0);
		REQUIRE(first[i].qty_sold == second[i].qty_sold);
		REQUIRE(first[i].pred_lower == second[i].pred_lower);
	}
}
