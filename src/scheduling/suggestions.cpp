#include "tastecast/scheduling/suggestions.hpp"

#include <map>
#include <numeric>
#include <random>

namespace tastecast::scheduling {

namespace {

const std::map<std::string, std::vector<std::string>> &menuPools() {
	static const std::map<std::string, std::vector<std::string>> pools = {
	    {"apples",
	     {"Apple Crumble Cups", "Apple Turnovers", "Apple Cider Donuts", "Caramel Apple Slices", "Mini Apple Hand Pies",
	      "Apple Compote Pancakes", "Apple-Oat Parfait", "Cheddar Apple Grilled Cheese", "Apple Galette Slices"}},
	    {"dough",
	     {"Garlic Knots", "Cinnamon Rolls", "Mini Calzones", "Savory Hand Pies", "Flatbread Special", "Herb Breadsticks",
	      "Stuffed Bread Bites", "Chocolate Swirl Rolls", "Cheese Twists"}},
	};
	return pools;
}

const std::vector<std::string> &defaultPool() {
	static const std::vector<std::string> pool = {"Chef's Choice Special 1", "Chef's Choice Special 2",
	                                              "Chef's Choice Special 3", "Chef's Choice Special 4",
	                                              "Chef's Choice Special 5", "Chef's Choice Special 6"};
	return pool;
}

} // namespace

const std::vector<std::string> &menuPool(const std::string &ingredient) {
	const auto &pools = menuPools();
	const auto it = pools.find(ingredient);
	return it == pools.end() ? defaultPool() : it->second;
}

std::vector<std::string> suggestions(const std::string &ingredient, std::size_t k, std::uint64_t seed) {
	const auto &pool = menuPool(ingredient);
	if (pool.size() <= k) {
		return pool;
	}

	// Partial Fisher-Yates over pool indices
	std::vector<std::size_t> order(pool.size());
	std::iota(order.begin(), order.end(), 0);
	std::mt19937_64 rng(seed);
	std::vector<std::string> picks;
	picks.reserve(k);
	for (std::size_t i = 0; i < k; ++i) {
		std::uniform_int_distribution<std::size_t> dist(i, order.size() - 1);
		std::swap(order[i], order[dist(rng)]);
		picks.push_back(pool[order[i]]);
	}
	return picks;
}

std::string joinSuggestions(const std::vector<std::string> &items) {
	std::string joined;
	for (std::size_t i = 0; i < items.size(); ++i) {
		if (i > 0) {
			joined += ", ";
		}
		joined += items[i];
	}
	return joined;
}

} // namespace tastecast::scheduling
