#pragma once

#include "tastecast/core/forecast.hpp"

#include <iosfwd>
#include <string>
#include <vector>

namespace tastecast::io {

/**
 * @class ReportWriter
 * @brief Operator-facing CSV exports of forecasts, plans and advisories.
 *
 * Prediction columns are written with one decimal and only when at least one
 * record carries a prediction. Plan quantities are whole units. The path
 * overloads create missing parent directories and throw std::runtime_error
 * when the file cannot be written.
 */
class ReportWriter {
public:
	static void writeForecast(const std::vector<core::ForecastRecord> &records, std::ostream &out);
	static void writeForecast(const std::vector<core::ForecastRecord> &records, const std::string &path);

	/// Columns: date, qty_sold, [pred_*], qty_total, special_added, <ing>_need..., <ing>_shortfall...
	static void writePlan(const core::Plan &plan, std::ostream &out);
	static void writePlan(const core::Plan &plan, const std::string &path);

	/// Columns: date, type, ingredient, qty, special_qty, suggestions, message, reason, [pred_*, pred_summary]
	static void writeAdvisories(const std::vector<core::Advisory> &advisories, std::ostream &out);
	static void writeAdvisories(const std::vector<core::Advisory> &advisories, const std::string &path);

	/// Quotes a cell when it contains a comma, quote or line break.
	static std::string escape(const std::string &cell);
};

} // namespace tastecast::io
