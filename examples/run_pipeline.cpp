#include "tastecast/config/pipeline_config.hpp"
#include "tastecast/io/demand_csv.hpp"
#include "tastecast/io/report_writer.hpp"
#include "tastecast/pipeline/pipeline.hpp"
#include "tastecast/utils/logging.hpp"

#include <filesystem>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

using namespace tastecast;

namespace {

struct Options {
	std::string data;
	std::optional<std::string> config;
	std::optional<int> days;
	std::string out = "out";
};

void printUsage(const char *program) {
	std::cerr << "Usage: " << program << " --data <csv> [--config <json>] [--days N] [--out <dir>]\n";
}

Options parseArgs(int argc, char **argv) {
	Options options;
	for (int i = 1; i < argc; ++i) {
		const std::string arg = argv[i];
		auto next = [&]() -> std::string {
			if (i + 1 >= argc) {
				throw std::invalid_argument("Missing value for " + arg);
			}
			return argv[++i];
		};
		if (arg == "--data") {
			options.data = next();
		} else if (arg == "--config") {
			options.config = next();
		} else if (arg == "--days") {
			const auto value = next();
			std::size_t consumed = 0;
			const int days = std::stoi(value, &consumed);
			if (consumed != value.size()) {
				throw std::invalid_argument("--days expects an integer, got '" + value + "'");
			}
			options.days = days;
		} else if (arg == "--out") {
			options.out = next();
		} else {
			throw std::invalid_argument("Unknown argument: " + arg);
		}
	}
	if (options.data.empty()) {
		throw std::invalid_argument("--data is required");
	}
	return options;
}

// Used when no --config is given.
inventory::Recipe defaultRecipe() {
	return inventory::Recipe(std::vector<inventory::Recipe::Entry> {{"apples", 3.0}, {"dough", 1.0}});
}

config::PipelineConfig loadConfig(const Options &options) {
	auto cfg = options.config ? config::PipelineConfig::load(*options.config)
	                          : config::PipelineConfig::withRecipe(defaultRecipe());
	if (options.days) {
		cfg = cfg.withHorizon(*options.days);
	}
	return cfg;
}

} // namespace

int main(int argc, char **argv) {
	Options options;
	try {
		options = parseArgs(argc, argv);
	} catch (const std::exception &e) {
		std::cerr << "Error: " << e.what() << "\n";
		printUsage(argv[0]);
		return 2;
	}

	try {
		const auto cfg = loadConfig(options);
		utils::Logging::init(cfg.logLevel());

		const auto table = io::loadDemandHistory(options.data, cfg.production().recipe.ingredients());
		const pipeline::Pipeline runner(cfg);
		const auto result = runner.run(table);

		const std::filesystem::path out_dir(options.out);
		io::ReportWriter::writeForecast(result.forecast, (out_dir / "forecast.csv").string());
		io::ReportWriter::writePlan(result.schedule.plan, (out_dir / "daily_plan.csv").string());
		io::ReportWriter::writeAdvisories(result.schedule.advisories, (out_dir / "advisories.csv").string());

		std::cout << "History rows:     " << table.series.size() << "\n";
		std::cout << "Training rows:    " << result.training_rows << "\n";
		std::cout << "Ridge penalty:    " << result.selected_penalty << "\n";
		if (result.holdout) {
			std::cout << "Hold-out MAE:     " << result.holdout->metrics.mae << " over " << result.holdout->test_rows
			          << " days\n";
		}
		std::cout << "Forecast days:    " << result.forecast.size() << "\n";
		std::cout << "BUY advisories:   " << result.schedule.countAdvisories(core::AdvisoryKind::Buy) << "\n";
		std::cout << "SPECIAL advisories: " << result.schedule.countAdvisories(core::AdvisoryKind::Special) << "\n";
		std::cout << "Outputs written to " << out_dir.string() << "\n";
	} catch (const std::exception &e) {
		std::cerr << "Error: " << e.what() << "\n";
		return 1;
	}
	return 0;
}
