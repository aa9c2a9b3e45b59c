#include "tastecast/inventory/recipe.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace tastecast::inventory {

Recipe::Recipe(std::vector<Entry> entries) {
	names_.reserve(entries.size());
	ratios_.reserve(entries.size());
	for (auto &entry : entries) {
		if (entry.first.empty()) {
			throw std::invalid_argument("Recipe ingredient names must not be empty.");
		}
		if (contains(entry.first)) {
			throw std::invalid_argument("Duplicate recipe ingredient '" + entry.first + "'.");
		}
		if (!std::isfinite(entry.second) || entry.second < 0.0) {
			throw std::invalid_argument("Recipe ratio for '" + entry.first + "' must be a non-negative number.");
		}
		names_.push_back(std::move(entry.first));
		ratios_.push_back(entry.second);
	}
}

std::optional<std::size_t> Recipe::indexOf(const std::string &ingredient) const {
	const auto it = std::find(names_.begin(), names_.end(), ingredient);
	if (it == names_.end()) {
		return std::nullopt;
	}
	return static_cast<std::size_t>(it - names_.begin());
}

double Recipe::ratio(const std::string &ingredient) const {
	const auto index = indexOf(ingredient);
	if (!index) {
		throw std::out_of_range("Ingredient '" + ingredient + "' is not part of the recipe.");
	}
	return ratios_[*index];
}

std::vector<double> Recipe::neededForItems(double items) const {
	std::vector<double> needed;
	needed.reserve(ratios_.size());
	for (double ratio : ratios_) {
		needed.push_back(ratio * items);
	}
	return needed;
}

} // namespace tastecast::inventory
