#pragma once

#include "tastecast/forecasting/window_generator.hpp"
#include "tastecast/inventory/recipe.hpp"
#include "tastecast/scheduling/specials_scheduler.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace tastecast::config {

/// Model fitting and forecast window settings ("forecast" section).
struct ForecastSettings {
	int horizon_days = 365;
	std::optional<int> cutoff_year;
	double alpha = 0.05;
	int n_boot = 500;
	std::uint64_t seed = 0;
	std::vector<double> penalties {0.1, 0.3, 1.0, 3.0, 10.0};
	int cv_splits = 5;
	int holdout_days = 0;
};

/// Recipe and promotion settings ("production" section).
struct ProductionSettings {
	inventory::Recipe recipe;
	std::vector<int> special_days;
	int special_boost_max_per_day = 5;
	std::map<std::string, int> shelf_life_days;
};

/// Vendor and stock settings ("store" section).
struct StoreSettings {
	std::optional<int> vendor_weekday;
	std::map<std::string, int> restock_lot_size;
	double service_level = 0.95;
	int lead_time_days = 2;
	std::map<std::string, int> start_stock;
};

/**
 * @class PipelineConfig
 * @brief Validated, immutable settings of one pipeline run.
 *
 * Built from JSON with the sections "forecast", "production", "store",
 * "suggestions" and "logging". Only production.recipe is required. Recipe
 * order follows the document order.
 */
class PipelineConfig {
public:
	/**
	 * @brief Reads and validates a JSON configuration file.
	 * @throws std::runtime_error If the file cannot be opened.
	 * @throws std::invalid_argument On malformed JSON or an invalid value, naming the key.
	 */
	static PipelineConfig load(const std::string &path);

	/// Parses JSON text. @throws std::invalid_argument As load().
	static PipelineConfig parse(const std::string &text);

	/// Builds from a parsed document. @throws std::invalid_argument As load().
	static PipelineConfig fromJson(const nlohmann::ordered_json &document);

	/// Defaults with the given recipe.
	static PipelineConfig withRecipe(inventory::Recipe recipe);

	const ForecastSettings &forecast() const {
		return forecast_;
	}

	const ProductionSettings &production() const {
		return production_;
	}

	const StoreSettings &store() const {
		return store_;
	}

	std::uint64_t suggestionSeed() const {
		return suggestion_seed_;
	}

	spdlog::level::level_enum logLevel() const {
		return log_level_;
	}

	/// Copy with a different forecast horizon. @throws std::invalid_argument If @p days is negative.
	PipelineConfig withHorizon(int days) const;

	forecasting::ForecastConfig forecastConfig() const;

	/**
	 * @brief Scheduler inputs.
	 * @param observed_stock Stock used for ingredients the configuration gives no start stock for.
	 */
	scheduling::SchedulerConfig schedulerConfig(const std::map<std::string, int> &observed_stock = {}) const;

private:
	PipelineConfig() = default;

	void validate() const;

	ForecastSettings forecast_;
	ProductionSettings production_;
	StoreSettings store_;
	std::uint64_t suggestion_seed_ = 0;
	spdlog::level::level_enum log_level_ = spdlog::level::info;
};

} // namespace tastecast::config
