#include "tastecast/io/demand_csv.hpp"
#include "tastecast/utils/logging.hpp"

#include <algorithm>
#include <cmath>
#include <fstream>
#include <limits>
#include <numeric>
#include <stdexcept>

namespace tastecast::io {

namespace {

std::string trim(const std::string &text) {
	const auto first = text.find_first_not_of(" \t\r\n");
	if (first == std::string::npos) {
		return "";
	}
	const auto last = text.find_last_not_of(" \t\r\n");
	return text.substr(first, last - first + 1);
}

bool isBlank(const std::string &line) {
	return line.find_first_not_of(" \t\r\n,") == std::string::npos;
}

double parseNumber(const std::string &cell, bool &ok) {
	ok = false;
	if (cell.empty()) {
		return std::numeric_limits<double>::quiet_NaN();
	}
	try {
		std::size_t consumed = 0;
		const double value = std::stod(cell, &consumed);
		if (consumed != cell.size()) {
			return std::numeric_limits<double>::quiet_NaN();
		}
		ok = true;
		return value;
	} catch (const std::invalid_argument &) {
		return std::numeric_limits<double>::quiet_NaN();
	} catch (const std::out_of_range &) {
		return std::numeric_limits<double>::quiet_NaN();
	}
}

std::string where(const std::string &source, std::size_t line_no) {
	return source + ":" + std::to_string(line_no);
}

} // namespace

const std::vector<double> &DemandTable::column(const std::string &name) const {
	const auto it = auxiliary.find(name);
	if (it == auxiliary.end()) {
		throw std::out_of_range("Column not found: " + name);
	}
	return it->second;
}

void DemandTable::setColumn(const std::string &name, std::vector<double> values) {
	if (values.size() != series.size()) {
		throw std::invalid_argument("Column '" + name + "' length does not match the series.");
	}
	if (auxiliary.count(name) == 0) {
		auxiliary_names.push_back(name);
	}
	auxiliary[name] = std::move(values);
}

std::vector<std::string> DemandCsvReader::splitLine(const std::string &line) {
	std::vector<std::string> cells;
	std::string cell;
	bool quoted = false;
	bool was_quoted = false;

	for (std::size_t i = 0; i < line.size(); ++i) {
		const char ch = line[i];
		if (quoted) {
			if (ch == '"') {
				if (i + 1 < line.size() && line[i + 1] == '"') {
					cell.push_back('"');
					++i;
				} else {
					quoted = false;
				}
			} else {
				cell.push_back(ch);
			}
		} else if (ch == '"') {
			if (trim(cell).empty()) {
				cell.clear();
			}
			quoted = true;
			was_quoted = true;
		} else if (ch == ',') {
			cells.push_back(was_quoted ? cell : trim(cell));
			cell.clear();
			was_quoted = false;
		} else if (!(was_quoted && (ch == ' ' || ch == '\t' || ch == '\r'))) {
			cell.push_back(ch);
		}
	}
	cells.push_back(was_quoted ? cell : trim(cell));
	return cells;
}

DemandTable DemandCsvReader::read(const std::string &path) {
	std::ifstream file(path);
	if (!file.is_open()) {
		throw std::runtime_error("Cannot open file: " + path);
	}
	auto table = parse(file, path);
	TASTECAST_INFO("Loaded {} demand rows from {}.", table.series.size(), path);
	return table;
}

DemandTable DemandCsvReader::parse(std::istream &input, const std::string &source) {
	std::string line;
	std::size_t line_no = 0;
	std::vector<std::string> headers;
	while (std::getline(input, line)) {
		++line_no;
		if (!isBlank(line)) {
			headers = splitLine(line);
			break;
		}
	}
	if (headers.empty()) {
		throw std::invalid_argument(source + ": missing header row.");
	}

	const auto date_it = std::find(headers.begin(), headers.end(), "date");
	const auto qty_it = std::find(headers.begin(), headers.end(), "qty_sold");
	if (date_it == headers.end() || qty_it == headers.end()) {
		throw std::invalid_argument(source + ": header must contain 'date' and 'qty_sold' columns.");
	}
	const auto date_col = static_cast<std::size_t>(date_it - headers.begin());
	const auto qty_col = static_cast<std::size_t>(qty_it - headers.begin());

	std::vector<core::Date> dates;
	std::vector<double> quantities;
	std::vector<std::vector<double>> aux_rows;

	while (std::getline(input, line)) {
		++line_no;
		if (isBlank(line)) {
			continue;
		}
		const auto cells = splitLine(line);
		if (cells.size() != headers.size()) {
			throw std::invalid_argument(where(source, line_no) + ": expected " + std::to_string(headers.size()) +
			                            " cells, found " + std::to_string(cells.size()) + ".");
		}

		try {
			dates.push_back(core::Date::parse(cells[date_col]));
		} catch (const std::invalid_argument &e) {
			throw std::invalid_argument(where(source, line_no) + ": column 'date': " + e.what());
		}

		bool ok = false;
		const double qty = parseNumber(cells[qty_col], ok);
		if (!ok || !std::isfinite(qty) || qty < 0.0 || std::floor(qty) != qty) {
			throw std::invalid_argument(where(source, line_no) +
			                            ": column 'qty_sold' must be a non-negative integer, got '" + cells[qty_col] +
			                            "'.");
		}
		quantities.push_back(qty);

		std::vector<double> aux;
		aux.reserve(headers.size() - 2);
		for (std::size_t c = 0; c < headers.size(); ++c) {
			if (c != date_col && c != qty_col) {
				aux.push_back(parseNumber(cells[c], ok));
			}
		}
		aux_rows.push_back(std::move(aux));
	}

	std::vector<std::size_t> order(dates.size());
	std::iota(order.begin(), order.end(), 0);
	std::stable_sort(order.begin(), order.end(), [&dates](std::size_t a, std::size_t b) { return dates[a] < dates[b]; });
	for (std::size_t i = 1; i < order.size(); ++i) {
		if (dates[order[i]] == dates[order[i - 1]]) {
			throw std::invalid_argument(source + ": duplicate date " + dates[order[i]].toString() + ".");
		}
	}

	std::vector<core::Date> sorted_dates;
	std::vector<double> sorted_qty;
	sorted_dates.reserve(order.size());
	sorted_qty.reserve(order.size());
	for (std::size_t idx : order) {
		sorted_dates.push_back(dates[idx]);
		sorted_qty.push_back(quantities[idx]);
	}

	DemandTable table;
	table.series = core::DemandSeries(std::move(sorted_dates), std::move(sorted_qty));

	std::size_t aux_index = 0;
	for (std::size_t c = 0; c < headers.size(); ++c) {
		if (c == date_col || c == qty_col) {
			continue;
		}
		std::vector<double> values;
		values.reserve(order.size());
		for (std::size_t idx : order) {
			values.push_back(aux_rows[idx][aux_index]);
		}
		table.setColumn(headers[c], std::move(values));
		++aux_index;
	}

	const auto missing = table.series.countMissingDays();
	if (missing > 0) {
		TASTECAST_WARN("{}: {} calendar days are missing from the demand history.", source, missing);
	}
	return table;
}

std::map<std::string, std::vector<int>> inferRestockFlags(const DemandTable &table,
                                                          const std::vector<std::string> &ingredients) {
	std::map<std::string, std::vector<int>> flags;
	const std::size_t n = table.series.size();
	for (const auto &ing : ingredients) {
		const auto existing = "restocked_" + ing;
		if (table.hasColumn(existing)) {
			const auto &values = table.column(existing);
			std::vector<int> column(n, 0);
			for (std::size_t i = 0; i < n; ++i) {
				column[i] = std::isfinite(values[i]) && values[i] != 0.0 ? 1 : 0;
			}
			flags[ing] = std::move(column);
			continue;
		}
		if (!table.hasColumn(ing + "_start") || !table.hasColumn(ing + "_end")) {
			continue;
		}
		const auto &start = table.column(ing + "_start");
		const auto &end = table.column(ing + "_end");
		std::vector<int> column(n, 0);
		for (std::size_t i = 1; i < n; ++i) {
			// NaN comparisons are false, so gaps never flag a restock
			column[i] = start[i] > end[i - 1] ? 1 : 0;
		}
		flags[ing] = std::move(column);
	}
	return flags;
}

void addRestockFlags(DemandTable &table, const std::vector<std::string> &ingredients) {
	for (const auto &entry : inferRestockFlags(table, ingredients)) {
		const auto name = "restocked_" + entry.first;
		if (table.hasColumn(name)) {
			continue;
		}
		table.setColumn(name, std::vector<double>(entry.second.begin(), entry.second.end()));
	}
}

DemandTable loadDemandHistory(const std::string &path, const std::vector<std::string> &ingredients) {
	auto table = DemandCsvReader::read(path);
	addRestockFlags(table, ingredients);
	for (const auto &ing : ingredients) {
		const auto name = "restocked_" + ing;
		if (!table.hasColumn(name)) {
			continue;
		}
		const auto &flags = table.column(name);
		const auto restocks =
		    std::count_if(flags.begin(), flags.end(), [](double v) { return std::isfinite(v) && v != 0.0; });
		TASTECAST_INFO("{}: {} restock days recorded in the history.", ing, restocks);
	}
	return table;
}

std::map<std::string, int> lastEndingStock(const DemandTable &table, const std::vector<std::string> &ingredients) {
	std::map<std::string, int> stock;
	if (table.series.empty()) {
		return stock;
	}
	for (const auto &ing : ingredients) {
		const auto name = ing + "_end";
		if (!table.hasColumn(name)) {
			continue;
		}
		const double value = table.column(name).back();
		if (!std::isfinite(value)) {
			continue;
		}
		if (value > static_cast<double>(std::numeric_limits<int>::max())) {
			throw std::invalid_argument("Column '" + name + "' holds a stock level out of range: " +
			                            std::to_string(value) + ".");
		}
		stock[ing] = value < 0.0 ? 0 : static_cast<int>(value);
	}
	return stock;
}

} // namespace tastecast::io
