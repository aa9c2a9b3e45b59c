#include "tastecast/io/report_writer.hpp"
#include "tastecast/utils/logging.hpp"

#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace tastecast::io {

namespace {

std::string oneDecimal(double value) {
	std::ostringstream oss;
	oss << std::fixed << std::setprecision(1) << value;
	return oss.str();
}

std::ofstream openForWrite(const std::string &path) {
	const std::filesystem::path target(path);
	if (target.has_parent_path()) {
		std::error_code ec;
		std::filesystem::create_directories(target.parent_path(), ec);
		if (ec) {
			throw std::runtime_error("Cannot create directory " + target.parent_path().string() + ": " + ec.message());
		}
	}
	std::ofstream out(path);
	if (!out.is_open()) {
		throw std::runtime_error("Cannot open file for writing: " + path);
	}
	return out;
}

void finish(std::ofstream &out, const std::string &path, std::size_t rows) {
	out.flush();
	if (!out) {
		throw std::runtime_error("Failed writing " + path);
	}
	TASTECAST_INFO("Wrote {} rows to {}.", rows, path);
}

void writePrediction(std::ostream &out, const core::Prediction &prediction) {
	out << ',' << oneDecimal(prediction.mean) << ',' << oneDecimal(prediction.lower) << ','
	    << oneDecimal(prediction.upper);
}

} // namespace

std::string ReportWriter::escape(const std::string &cell) {
	if (cell.find_first_of(",\"\r\n") == std::string::npos) {
		return cell;
	}
	std::string quoted = "\"";
	for (char ch : cell) {
		if (ch == '"') {
			quoted += '"';
		}
		quoted += ch;
	}
	quoted += '"';
	return quoted;
}

void ReportWriter::writeForecast(const std::vector<core::ForecastRecord> &records, std::ostream &out) {
	out << "date,qty_sold,pred_mean,pred_lower,pred_upper\n";
	for (const auto &record : records) {
		out << record.date.toString() << ',' << record.qty_sold;
		writePrediction(out, record.prediction());
		out << '\n';
	}
}

void ReportWriter::writeForecast(const std::vector<core::ForecastRecord> &records, const std::string &path) {
	auto out = openForWrite(path);
	writeForecast(records, out);
	finish(out, path, records.size());
}

void ReportWriter::writePlan(const core::Plan &plan, std::ostream &out) {
	const bool predictions = plan.hasPredictions();
	out << "date,qty_sold";
	if (predictions) {
		out << ",pred_mean,pred_lower,pred_upper";
	}
	out << ",qty_total,special_added";
	for (const auto &ing : plan.ingredients) {
		out << ',' << escape(ing + "_need");
	}
	for (const auto &ing : plan.ingredients) {
		out << ',' << escape(ing + "_shortfall");
	}
	out << '\n';

	for (const auto &day : plan.days) {
		out << day.date.toString() << ',' << day.qty_sold;
		if (predictions) {
			if (day.prediction) {
				writePrediction(out, *day.prediction);
			} else {
				out << ",,,";
			}
		}
		out << ',' << day.qty_total << ',' << day.special_added;
		for (std::size_t k = 0; k < plan.ingredients.size(); ++k) {
			// Whole units, truncated
			out << ',' << (k < day.needs.size() ? static_cast<long long>(day.needs[k]) : 0LL);
		}
		for (std::size_t k = 0; k < plan.ingredients.size(); ++k) {
			out << ',' << (k < day.shortfall.size() ? day.shortfall[k] : 0);
		}
		out << '\n';
	}
}

void ReportWriter::writePlan(const core::Plan &plan, const std::string &path) {
	auto out = openForWrite(path);
	writePlan(plan, out);
	finish(out, path, plan.days.size());
}

void ReportWriter::writeAdvisories(const std::vector<core::Advisory> &advisories, std::ostream &out) {
	bool predictions = false;
	for (const auto &advisory : advisories) {
		predictions = predictions || advisory.prediction.has_value();
	}

	out << "date,type,ingredient,qty,special_qty,suggestions,message,reason";
	if (predictions) {
		out << ",pred_mean,pred_lower,pred_upper,pred_summary";
	}
	out << '\n';

	for (const auto &advisory : advisories) {
		out << advisory.date.toString() << ',' << escape(advisory.type) << ',' << escape(advisory.ingredient) << ',';
		if (advisory.qty) {
			out << *advisory.qty;
		}
		out << ',' << advisory.special_qty.value_or(0) << ',' << escape(advisory.suggestions.value_or("")) << ','
		    << escape(advisory.message) << ',' << escape(advisory.reason);
		if (predictions) {
			if (advisory.prediction) {
				writePrediction(out, *advisory.prediction);
			} else {
				out << ",,,";
			}
			out << ',' << escape(advisory.pred_summary.value_or(""));
		}
		out << '\n';
	}
}

void ReportWriter::writeAdvisories(const std::vector<core::Advisory> &advisories, const std::string &path) {
	auto out = openForWrite(path);
	writeAdvisories(advisories, out);
	finish(out, path, advisories.size());
}

} // namespace tastecast::io
