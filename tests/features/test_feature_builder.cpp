#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include "common/demand_helpers.hpp"
#include "tastecast/features/feature_builder.hpp"

#include <numeric>
#include <stdexcept>
#include <vector>

using tastecast::core::Date;
using namespace tastecast::features;

TEST_CASE("Thanksgiving is the fourth Thursday of November", "[features][calendar]") {
	REQUIRE(thanksgivingDay(2024) == Date::fromYmd(2024, 11, 28));
	REQUIRE(thanksgivingDay(2023) == Date::fromYmd(2023, 11, 23));
	REQUIRE(thanksgivingDay(2025) == Date::fromYmd(2025, 11, 27));
	REQUIRE(isThanksgiving(Date::fromYmd(2024, 11, 28)));
	REQUIRE_FALSE(isThanksgiving(Date::fromYmd(2024, 11, 21)));
}

TEST_CASE("Calendar features flag weekends and fixed holidays", "[features][calendar]") {
	const auto xmas = FeatureBuilder::calendarFeatures(Date::fromYmd(2022, 12, 25));
	REQUIRE(xmas.dow == 6);
	REQUIRE(xmas.month == 12);
	REQUIRE(xmas.is_weekend == 1);
	REQUIRE(xmas.is_xmas == 1);
	REQUIRE(xmas.is_july4 == 0);

	const auto july4 = FeatureBuilder::calendarFeatures(Date::fromYmd(2025, 7, 4));
	REQUIRE(july4.is_july4 == 1);
	REQUIRE(july4.is_weekend == 0);

	const auto piday = FeatureBuilder::calendarFeatures(Date::fromYmd(2025, 3, 14));
	REQUIRE(piday.is_piday == 1);

	const auto thanksgiving = FeatureBuilder::calendarFeatures(Date::fromYmd(2023, 11, 23));
	REQUIRE(thanksgiving.is_thanksgiving == 1);
	REQUIRE(thanksgiving.dow == 3);
}

TEST_CASE("Feature names follow the model column order", "[features]") {
	const auto &names = featureNames();
	REQUIRE(names.size() == kFeatureCount);
	REQUIRE(names.front() == "dow");
	REQUIRE(names[6] == "is_thanksgiving");
	REQUIRE(names[7] == "lag_1");
	REQUIRE(names.back() == "roll28");
}

TEST_CASE("Lag and rolling features only use prior days", "[features][leakage]") {
	const auto start = Date::fromYmd(2025, 1, 1);
	std::vector<double> values(40);
	std::iota(values.begin(), values.end(), 1.0);
	const auto series = tests::helpers::makeSeries(start, values);
	const auto rows = FeatureBuilder::build(series);

	REQUIRE(rows.size() == values.size());
	REQUIRE_FALSE(rows[0].lag_1.has_value());
	REQUIRE_FALSE(rows[0].roll7.has_value());
	REQUIRE(rows[1].lag_1.value() == values[0]);
	REQUIRE(rows[1].roll7.value() == Catch::Approx(values[0]));

	for (std::size_t t = 1; t < rows.size(); ++t) {
		REQUIRE(rows[t].lag_1.value() == values[t - 1]);
	}

	// Day 30: lag_7 is day 23, roll7 averages days 23..29, roll28 days 2..29
	const auto &row = rows[30];
	REQUIRE(row.lag_7.value() == values[23]);
	REQUIRE(row.roll7.value() == Catch::Approx((values[23] + values[29]) / 2.0));
	REQUIRE(row.roll28.value() == Catch::Approx((values[2] + values[29]) / 2.0));
	REQUIRE(row.complete);
	REQUIRE_FALSE(rows[27].complete);
	REQUIRE(rows[28].complete);
}

TEST_CASE("Training set drops rows with short history", "[features][training]") {
	const auto start = Date::fromYmd(2025, 1, 1);
	const auto series = tests::helpers::makeWeeklySeries(start, 60);
	const auto training = FeatureBuilder::trainingSet(series);

	REQUIRE(training.size() == 60 - kLongWindow);
	REQUIRE(training.X.rows() == static_cast<Eigen::Index>(training.size()));
	REQUIRE(training.X.cols() == static_cast<Eigen::Index>(kFeatureCount));
	REQUIRE(training.dates.front() == start + static_cast<std::int64_t>(kLongWindow));
	REQUIRE(training.source_rows.front() == kLongWindow);
	REQUIRE(training.y(0) == series.quantityAt(kLongWindow));
	// lag_1 column holds the previous day's demand
	REQUIRE(training.X(0, 7) == series.quantityAt(kLongWindow - 1));

	const auto short_series = tests::helpers::makeWeeklySeries(start, 20);
	REQUIRE(FeatureBuilder::trainingSet(short_series).size() == 0);
}

TEST_CASE("Incomplete rows refuse training values", "[features][training]") {
	const auto rows = FeatureBuilder::build(tests::helpers::makeSeries(Date::fromYmd(2025, 1, 1), {3.0, 4.0}));
	REQUIRE_THROWS_AS(rows[1].trainingValues(), std::invalid_argument);
}

TEST_CASE("Forecast values substitute missing lags", "[features][forecast]") {
	DemandAccumulator empty;
	const auto first = empty.nextFeatures(Date::fromYmd(2025, 1, 1)).forecastValues();
	REQUIRE(first[7] == 0.0);
	REQUIRE(first[8] == 0.0);
	REQUIRE(first[9] == 0.0);
	REQUIRE(first[10] == 0.0);

	const auto start = Date::fromYmd(2025, 1, 1);
	DemandAccumulator acc(tests::helpers::makeSeries(start, {2.0, 4.0, 6.0}));
	const auto row = acc.nextFeatures(start + 3);
	REQUIRE_FALSE(row.lag_7.has_value());
	const auto values = row.forecastValues();
	REQUIRE(values[7] == 6.0);
	REQUIRE(values[8] == Catch::Approx(4.0));
	REQUIRE(values[9] == Catch::Approx(4.0));
	REQUIRE(values[10] == Catch::Approx(4.0));
}

TEST_CASE("Accumulator matches batch features and validates appends", "[features][forecast]") {
	const auto start = Date::fromYmd(2025, 1, 1);
	const auto series = tests::helpers::makeWeeklySeries(start, 45);
	const auto rows = FeatureBuilder::build(series);

	DemandAccumulator acc(series.slice(0, 35));
	const auto next = acc.nextFeatures(start + 35);
	REQUIRE(next.lag_1.value() == rows[35].lag_1.value());
	REQUIRE(next.lag_7.value() == rows[35].lag_7.value());
	REQUIRE(next.roll7.value() == Catch::Approx(rows[35].roll7.value()));
	REQUIRE(next.roll28.value() == Catch::Approx(rows[35].roll28.value()));

	acc.append(start + 35, 12.0);
	REQUIRE(acc.size() == 36);
	REQUIRE(acc.nextFeatures(start + 36).lag_1.value() == 12.0);
	REQUIRE_THROWS_AS(acc.append(start + 35, 1.0), std::invalid_argument);
	REQUIRE_THROWS_AS(acc.append(start + 36, -1.0), std::invalid_argument);
}
