#pragma once

#include "tastecast/core/demand_series.hpp"

#include <iosfwd>
#include <map>
#include <string>
#include <vector>

namespace tastecast::io {

/**
 * @struct DemandTable
 * @brief Demand history plus the extra numeric columns found next to it.
 *
 * Auxiliary columns are aligned with the series rows (after sorting by date).
 * Empty or non-numeric cells are stored as NaN.
 */
struct DemandTable {
	core::DemandSeries series;
	std::vector<std::string> auxiliary_names;
	std::map<std::string, std::vector<double>> auxiliary;

	bool hasColumn(const std::string &name) const {
		return auxiliary.count(name) > 0;
	}

	/// @throws std::out_of_range If the column does not exist.
	const std::vector<double> &column(const std::string &name) const;

	/// Adds or replaces an auxiliary column. @throws std::invalid_argument On a length mismatch.
	void setColumn(const std::string &name, std::vector<double> values);
};

/**
 * @class DemandCsvReader
 * @brief Reads a daily demand history from CSV.
 *
 * The header row must contain @c date (ISO YYYY-MM-DD) and @c qty_sold. Cells are
 * comma separated, may be double-quoted, and are trimmed. Rows may come in any
 * order; they are sorted by date. Blank lines are skipped.
 */
class DemandCsvReader {
public:
	/**
	 * @throws std::runtime_error If @p path cannot be opened.
	 * @throws std::invalid_argument On missing columns, malformed cells or duplicate dates.
	 */
	static DemandTable read(const std::string &path);

	/// Parses CSV text; @p source names the input in error messages.
	static DemandTable parse(std::istream &input, const std::string &source = "<stream>");

	/// Splits one CSV line into trimmed cells, honoring double quotes.
	static std::vector<std::string> splitLine(const std::string &line);
};

/**
 * @brief Restock flags per ingredient inferred from opening and closing stock.
 *
 * For every ingredient with both @c <ing>_start and @c <ing>_end columns, day i
 * is flagged (1) when its opening stock exceeds the previous day's closing stock;
 * day 0 is never flagged. An existing @c restocked_<ing> column is returned as is.
 * Ingredients with neither are omitted.
 */
std::map<std::string, std::vector<int>> inferRestockFlags(const DemandTable &table,
                                                          const std::vector<std::string> &ingredients);

/// Adds the inferred flags to @p table as @c restocked_<ing> columns.
void addRestockFlags(DemandTable &table, const std::vector<std::string> &ingredients);

/**
 * @brief Reads a demand CSV and adds inferred @c restocked_<ing> columns for @p ingredients.
 * @throws As DemandCsvReader::read().
 */
DemandTable loadDemandHistory(const std::string &path, const std::vector<std::string> &ingredients);

/// Closing stock of the last day for every ingredient with a finite @c <ing>_end value.
std::map<std::string, int> lastEndingStock(const DemandTable &table, const std::vector<std::string> &ingredients);

} // namespace tastecast::io
