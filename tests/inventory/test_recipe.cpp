#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include "tastecast/inventory/recipe.hpp"

#include <limits>
#include <stdexcept>
#include <vector>

using tastecast::inventory::Recipe;
using Entries = std::vector<Recipe::Entry>;

TEST_CASE("Recipe keeps declaration order", "[inventory][recipe]") {
	const Recipe recipe({{"dough", 1.0}, {"apples", 3.0}});
	REQUIRE(recipe.size() == 2);
	REQUIRE(recipe.ingredients().front() == "dough");
	REQUIRE(recipe.indexOf("apples").value() == 1);
	REQUIRE(recipe.ratio("apples") == 3.0);
	REQUIRE(recipe.ratioAt(0) == 1.0);
	REQUIRE_FALSE(recipe.contains("sugar"));
	REQUIRE_THROWS_AS(recipe.ratio("sugar"), std::out_of_range);

	const auto needs = recipe.neededForItems(4.0);
	REQUIRE(needs[0] == Catch::Approx(4.0));
	REQUIRE(needs[1] == Catch::Approx(12.0));
}

TEST_CASE("Recipe rejects invalid entries", "[inventory][recipe]") {
	REQUIRE_THROWS_AS(Recipe(Entries {{"", 1.0}}), std::invalid_argument);
	REQUIRE_THROWS_AS(Recipe(Entries {{"apples", 1.0}, {"apples", 2.0}}), std::invalid_argument);
	REQUIRE_THROWS_AS(Recipe(Entries {{"apples", -1.0}}), std::invalid_argument);
	REQUIRE_THROWS_AS(Recipe(Entries {{"apples", std::numeric_limits<double>::infinity()}}), std::invalid_argument);
	REQUIRE_NOTHROW(Recipe(Entries {{"garnish", 0.0}}));
	REQUIRE(Recipe().empty());
}
