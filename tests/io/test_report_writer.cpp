#include <catch2/catch_test_macros.hpp>

#include "common/demand_helpers.hpp"
#include "tastecast/io/report_writer.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>

using tastecast::core::Advisory;
using tastecast::core::AdvisoryKind;
using tastecast::core::Date;
using tastecast::core::ForecastRecord;
using tastecast::core::Plan;
using tastecast::core::Prediction;
using tastecast::io::ReportWriter;

namespace {

std::vector<std::string> lines(const std::string &text) {
	std::vector<std::string> result;
	std::istringstream input(text);
	std::string line;
	while (std::getline(input, line)) {
		result.push_back(line);
	}
	return result;
}

bool endsWith(const std::string &text, const std::string &suffix) {
	return text.size() >= suffix.size() && text.compare(text.size() - suffix.size(), suffix.size(), suffix) == 0;
}

Advisory buyAdvisory() {
	Advisory advisory;
	advisory.date = Date::fromYmd(2025, 3, 3);
	advisory.kind = AdvisoryKind::Buy;
	advisory.type = "BUY_APPLES";
	advisory.ingredient = "apples";
	advisory.qty = 300;
	advisory.message = "2025-03-03: BUY 300 apples (stock 0 < ROP 77). Target cover=80.";
	advisory.reason = "below_ROP";
	return advisory;
}

Advisory specialAdvisory() {
	Advisory advisory;
	advisory.date = Date::fromYmd(2025, 3, 6);
	advisory.kind = AdvisoryKind::Special;
	advisory.type = "SPECIAL_DOUGH";
	advisory.ingredient = "dough";
	advisory.special_qty = 4;
	advisory.suggestions = "Garlic Knots, Cinnamon Rolls";
	advisory.message = "2025-03-06: Scheduled 4 extra items to burn surplus of dough.";
	advisory.reason = "surplus_burn";
	return advisory;
}

} // namespace

TEST_CASE("Cells with separators are quoted", "[io][report]") {
	REQUIRE(ReportWriter::escape("plain") == "plain");
	REQUIRE(ReportWriter::escape("a, b") == "\"a, b\"");
	REQUIRE(ReportWriter::escape("say \"hi\"") == "\"say \"\"hi\"\"\"");
	REQUIRE(ReportWriter::escape("") == "");
}

TEST_CASE("Forecast export writes one decimal predictions", "[io][report]") {
	ForecastRecord record;
	record.date = Date::fromYmd(2025, 1, 1);
	record.qty_sold = 7;
	record.pred_mean = 7.26;
	record.pred_lower = 4.04;
	record.pred_upper = 10.51;

	std::ostringstream out;
	ReportWriter::writeForecast({record}, out);
	const auto rows = lines(out.str());
	REQUIRE(rows.size() == 2);
	REQUIRE(rows[0] == "date,qty_sold,pred_mean,pred_lower,pred_upper");
	REQUIRE(rows[1] == "2025-01-01,7,7.3,4.0,10.5");
}

TEST_CASE("Plan export lists needs and shortfall per ingredient", "[io][report]") {
	Plan plan;
	plan.ingredients = {"apples", "dough"};
	plan.days = tests::helpers::makePlan(Date::fromYmd(2025, 1, 1), {3, 4});
	plan.days[0].qty_total = 5;
	plan.days[0].special_added = 2;
	plan.days[0].needs = {15.0, 5.0};
	plan.days[0].shortfall = {0, 1};
	plan.days[1].needs = {12.9, 4.0};
	plan.days[1].shortfall = {0, 0};

	std::ostringstream out;
	ReportWriter::writePlan(plan, out);
	const auto rows = lines(out.str());
	REQUIRE(rows.size() == 3);
	REQUIRE(rows[0] == "date,qty_sold,qty_total,special_added,apples_need,dough_need,apples_shortfall,dough_shortfall");
	REQUIRE(rows[1] == "2025-01-01,3,5,2,15,5,0,1");
	REQUIRE(rows[2] == "2025-01-02,4,4,0,12,4,0,0");
}

TEST_CASE("Plan export includes predictions when present", "[io][report]") {
	Plan plan;
	plan.ingredients = {"apples"};
	plan.days = tests::helpers::makePlan(Date::fromYmd(2025, 1, 1), {3});
	plan.days[0].prediction = Prediction {3.24, 1.0, 5.55};
	plan.days[0].needs = {9.0};
	plan.days[0].shortfall = {0};

	std::ostringstream out;
	ReportWriter::writePlan(plan, out);
	const auto rows = lines(out.str());
	REQUIRE(rows[0] == "date,qty_sold,pred_mean,pred_lower,pred_upper,qty_total,special_added,apples_need,apples_shortfall");
	REQUIRE(rows[1] == "2025-01-01,3,3.2,1.0,5.5,3,0,9,0");
}

TEST_CASE("Advisory export leaves quantities blank by kind", "[io][report]") {
	std::ostringstream out;
	ReportWriter::writeAdvisories({buyAdvisory(), specialAdvisory()}, out);
	const auto rows = lines(out.str());
	REQUIRE(rows.size() == 3);
	REQUIRE(rows[0] == "date,type,ingredient,qty,special_qty,suggestions,message,reason");
	REQUIRE(rows[1] ==
	        "2025-03-03,BUY_APPLES,apples,300,0,,2025-03-03: BUY 300 apples (stock 0 < ROP 77). Target cover=80.,below_ROP");
	REQUIRE(rows[2] == "2025-03-06,SPECIAL_DOUGH,dough,,4,\"Garlic Knots, Cinnamon Rolls\","
	                   "2025-03-06: Scheduled 4 extra items to burn surplus of dough.,surplus_burn");
}

TEST_CASE("Advisory export appends prediction columns", "[io][report]") {
	auto advisory = buyAdvisory();
	advisory.prediction = Prediction {7.14, 4.91, 9.86};
	advisory.pred_summary = "Pred 7.1 (4.9-9.9)";

	std::ostringstream out;
	ReportWriter::writeAdvisories({advisory, specialAdvisory()}, out);
	const auto rows = lines(out.str());
	REQUIRE(rows[0] == "date,type,ingredient,qty,special_qty,suggestions,message,reason,"
	                   "pred_mean,pred_lower,pred_upper,pred_summary");
	REQUIRE(endsWith(rows[1], ",below_ROP,7.1,4.9,9.9,Pred 7.1 (4.9-9.9)"));
	REQUIRE(endsWith(rows[2], ",surplus_burn,,,,"));
}

TEST_CASE("Empty advisory lists still get a header", "[io][report]") {
	std::ostringstream out;
	ReportWriter::writeAdvisories({}, out);
	REQUIRE(out.str() == "date,type,ingredient,qty,special_qty,suggestions,message,reason\n");
}

TEST_CASE("File exports create missing directories", "[io][report]") {
	const auto dir = std::filesystem::temp_directory_path() / "tastecast_report_test" / "nested";
	std::filesystem::remove_all(dir.parent_path());
	const auto path = dir / "advisories.csv";

	ReportWriter::writeAdvisories({buyAdvisory()}, path.string());
	REQUIRE(std::filesystem::exists(path));

	std::ifstream in(path);
	std::string header;
	std::getline(in, header);
	REQUIRE(header == "date,type,ingredient,qty,special_qty,suggestions,message,reason");
	in.close();
	std::filesystem::remove_all(dir.parent_path());
}
