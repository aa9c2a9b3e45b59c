#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace tastecast::scheduling {

/// Menu ideas that use up @p ingredient; unknown ingredients get the generic pool.
const std::vector<std::string> &menuPool(const std::string &ingredient);

/**
 * @brief Picks up to @p k distinct menu ideas for a promotion of @p ingredient.
 *
 * Returns the whole pool, in pool order, when it holds at most @p k entries.
 * Otherwise @p k entries are drawn without replacement from an engine seeded
 * with @p seed, so the same arguments always give the same list.
 */
std::vector<std::string> suggestions(const std::string &ingredient, std::size_t k = 5, std::uint64_t seed = 0);

/// Joins suggestions with ", " for messages and CSV cells.
std::string joinSuggestions(const std::vector<std::string> &items);

} // namespace tastecast::scheduling
