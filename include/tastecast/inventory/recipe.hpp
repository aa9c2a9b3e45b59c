#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace tastecast::inventory {

/**
 * @class Recipe
 * @brief Units of each ingredient consumed by one sold item.
 *
 * Keeps the order in which ingredients were declared; every per-ingredient
 * column and tie-break in the library follows that order.
 */
class Recipe {
public:
	using Entry = std::pair<std::string, double>;

	Recipe() = default;

	/**
	 * @throws std::invalid_argument On an empty name, a duplicate name, or a negative or non-finite ratio.
	 */
	explicit Recipe(std::vector<Entry> entries);

	const std::vector<std::string> &ingredients() const {
		return names_;
	}

	std::size_t size() const {
		return names_.size();
	}

	bool empty() const {
		return names_.empty();
	}

	bool contains(const std::string &ingredient) const {
		return indexOf(ingredient).has_value();
	}

	std::optional<std::size_t> indexOf(const std::string &ingredient) const;

	/**
	 * @brief Units of @p ingredient per item.
	 * @throws std::out_of_range If the ingredient is not part of the recipe.
	 */
	double ratio(const std::string &ingredient) const;

	double ratioAt(std::size_t index) const {
		return ratios_.at(index);
	}

	/// Ingredient units needed for @p items sold items, in ingredient order.
	std::vector<double> neededForItems(double items) const;

private:
	std::vector<std::string> names_;
	std::vector<double> ratios_;
};

} // namespace tastecast::inventory
