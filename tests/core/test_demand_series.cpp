#include <catch2/catch_test_macros.hpp>

#include "common/demand_helpers.hpp"
#include "tastecast/core/demand_series.hpp"

#include <limits>
#include <stdexcept>

using tastecast::core::Date;
using tastecast::core::DemandSeries;

TEST_CASE("DemandSeries validates its inputs", "[core][series]") {
	const auto start = Date::fromYmd(2025, 1, 1);
	REQUIRE_THROWS_AS(DemandSeries({start, start + 1}, {1.0}), std::invalid_argument);
	REQUIRE_THROWS_AS(DemandSeries({start + 1, start}, {1.0, 2.0}), std::invalid_argument);
	REQUIRE_THROWS_AS(DemandSeries({start, start}, {1.0, 2.0}), std::invalid_argument);
	REQUIRE_THROWS_AS(DemandSeries({start}, {-1.0}), std::invalid_argument);
	REQUIRE_THROWS_AS(DemandSeries({start}, {std::numeric_limits<double>::quiet_NaN()}), std::invalid_argument);
}

TEST_CASE("DemandSeries exposes dates and quantities", "[core][series]") {
	const auto start = Date::fromYmd(2025, 3, 1);
	const auto series = tests::helpers::makeSeries(start, {4.0, 5.0, 6.0});

	REQUIRE(series.size() == 3);
	REQUIRE_FALSE(series.empty());
	REQUIRE(series.dateAt(2) == start + 2);
	REQUIRE(series.quantityAt(1) == 5.0);
	REQUIRE(series.lastDate().has_value());
	REQUIRE(*series.lastDate() == start + 2);
	REQUIRE_FALSE(DemandSeries().lastDate().has_value());

	const auto tail = series.slice(1, 3);
	REQUIRE(tail.size() == 2);
	REQUIRE(tail.quantityAt(0) == 5.0);
	REQUIRE_THROWS_AS(series.slice(2, 4), std::out_of_range);
}

TEST_CASE("DemandSeries counts calendar gaps", "[core][series]") {
	const auto start = Date::fromYmd(2025, 3, 1);
	const DemandSeries gappy({start, start + 1, start + 4}, {1.0, 1.0, 1.0});
	REQUIRE(gappy.countMissingDays() == 2);
	REQUIRE(tests::helpers::makeSeries(start, {1.0, 2.0, 3.0}).countMissingDays() == 0);
}
