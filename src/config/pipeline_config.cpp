#include "tastecast/config/pipeline_config.hpp"
#include "tastecast/inventory/policy.hpp"
#include "tastecast/utils/logging.hpp"

#include <algorithm>
#include <cmath>
#include <fstream>
#include <limits>
#include <sstream>
#include <stdexcept>

namespace tastecast::config {

using Json = nlohmann::ordered_json;

namespace {

[[noreturn]] void fail(const std::string &key, const std::string &message) {
	throw std::invalid_argument("Config key '" + key + "': " + message);
}

const Json *section(const Json &document, const std::string &name) {
	if (!document.contains(name) || document.at(name).is_null()) {
		return nullptr;
	}
	const auto &value = document.at(name);
	if (!value.is_object()) {
		fail(name, "expected an object.");
	}
	return &value;
}

const Json *member(const Json *parent, const std::string &name) {
	if (parent == nullptr || !parent->contains(name) || parent->at(name).is_null()) {
		return nullptr;
	}
	return &parent->at(name);
}

int asInt(const Json &value, const std::string &key) {
	constexpr auto kMin = std::numeric_limits<int>::min();
	constexpr auto kMax = std::numeric_limits<int>::max();
	if (value.is_number_unsigned()) {
		if (value.get<std::uint64_t>() > static_cast<std::uint64_t>(kMax)) {
			fail(key, "integer out of range.");
		}
		return static_cast<int>(value.get<std::uint64_t>());
	}
	if (value.is_number_integer()) {
		const auto number = value.get<std::int64_t>();
		if (number < kMin || number > kMax) {
			fail(key, "integer out of range.");
		}
		return static_cast<int>(number);
	}
	if (value.is_number_float()) {
		const double number = value.get<double>();
		if (std::isfinite(number) && std::floor(number) == number) {
			if (number < static_cast<double>(kMin) || number > static_cast<double>(kMax)) {
				fail(key, "integer out of range.");
			}
			return static_cast<int>(number);
		}
	}
	fail(key, "expected an integer.");
}

double asDouble(const Json &value, const std::string &key) {
	if (!value.is_number()) {
		fail(key, "expected a number.");
	}
	return value.get<double>();
}

std::uint64_t asSeed(const Json &value, const std::string &key) {
	if (!value.is_number_integer() || (!value.is_number_unsigned() && value.get<long long>() < 0)) {
		fail(key, "expected a non-negative integer.");
	}
	return value.get<std::uint64_t>();
}

int asWeekday(const Json &value, const std::string &key) {
	std::optional<int> parsed;
	if (value.is_number_integer()) {
		parsed = inventory::parseWeekday(inventory::WeekdaySpec(asInt(value, key)));
	} else if (value.is_string()) {
		parsed = inventory::parseWeekday(inventory::WeekdaySpec(value.get<std::string>()));
	}
	if (!parsed) {
		fail(key, "unknown weekday " + value.dump() + ".");
	}
	return *parsed;
}

std::map<std::string, int> asIntMap(const Json &value, const std::string &key) {
	if (!value.is_object()) {
		fail(key, "expected an object of ingredient -> integer.");
	}
	std::map<std::string, int> result;
	for (auto it = value.begin(); it != value.end(); ++it) {
		result[it.key()] = asInt(it.value(), key + "." + it.key());
	}
	return result;
}

void checkIngredients(const std::map<std::string, int> &values, const inventory::Recipe &recipe,
                      const std::string &key) {
	for (const auto &entry : values) {
		if (!recipe.contains(entry.first)) {
			fail(key, "unknown ingredient '" + entry.first + "'.");
		}
	}
}

} // namespace

PipelineConfig PipelineConfig::load(const std::string &path) {
	std::ifstream file(path);
	if (!file.is_open()) {
		throw std::runtime_error("Cannot open config file: " + path);
	}
	std::stringstream buffer;
	buffer << file.rdbuf();
	auto config = parse(buffer.str());
	TASTECAST_INFO("Loaded configuration from {} ({} ingredients).", path, config.production_.recipe.size());
	return config;
}

PipelineConfig PipelineConfig::parse(const std::string &text) {
	Json document;
	try {
		document = Json::parse(text);
	} catch (const Json::parse_error &e) {
		throw std::invalid_argument(std::string("Invalid JSON configuration: ") + e.what());
	}
	return fromJson(document);
}

PipelineConfig PipelineConfig::fromJson(const Json &document) {
	if (!document.is_object()) {
		throw std::invalid_argument("Configuration must be a JSON object.");
	}

	PipelineConfig config;

	const auto *forecast = section(document, "forecast");
	if (const auto *v = member(forecast, "horizon_days")) {
		config.forecast_.horizon_days = asInt(*v, "forecast.horizon_days");
	}
	if (const auto *v = member(forecast, "cutoff_year")) {
		config.forecast_.cutoff_year = asInt(*v, "forecast.cutoff_year");
	}
	if (const auto *v = member(forecast, "alpha")) {
		config.forecast_.alpha = asDouble(*v, "forecast.alpha");
	}
	if (const auto *v = member(forecast, "n_boot")) {
		config.forecast_.n_boot = asInt(*v, "forecast.n_boot");
	}
	if (const auto *v = member(forecast, "seed")) {
		config.forecast_.seed = asSeed(*v, "forecast.seed");
	}
	if (const auto *v = member(forecast, "penalties")) {
		if (!v->is_array()) {
			fail("forecast.penalties", "expected an array of numbers.");
		}
		config.forecast_.penalties.clear();
		for (const auto &penalty : *v) {
			config.forecast_.penalties.push_back(asDouble(penalty, "forecast.penalties"));
		}
	}
	if (const auto *v = member(forecast, "cv_splits")) {
		config.forecast_.cv_splits = asInt(*v, "forecast.cv_splits");
	}
	if (const auto *v = member(forecast, "holdout_days")) {
		config.forecast_.holdout_days = asInt(*v, "forecast.holdout_days");
	}

	const auto *production = section(document, "production");
	const auto *recipe = member(production, "recipe");
	if (recipe == nullptr) {
		fail("production.recipe", "is required.");
	}
	if (!recipe->is_object()) {
		fail("production.recipe", "expected an object of ingredient -> units per item.");
	}
	std::vector<inventory::Recipe::Entry> entries;
	for (auto it = recipe->begin(); it != recipe->end(); ++it) {
		entries.emplace_back(it.key(), asDouble(it.value(), "production.recipe." + it.key()));
	}
	try {
		config.production_.recipe = inventory::Recipe(std::move(entries));
	} catch (const std::invalid_argument &e) {
		fail("production.recipe", e.what());
	}

	if (const auto *v = member(production, "special_days")) {
		if (!v->is_array()) {
			fail("production.special_days", "expected an array of weekdays.");
		}
		std::vector<inventory::WeekdaySpec> days;
		for (const auto &day : *v) {
			days.emplace_back(asWeekday(day, "production.special_days"));
		}
		config.production_.special_days = inventory::normalizeWeekdays(days);
	}
	if (const auto *v = member(production, "special_boost_max_per_day")) {
		config.production_.special_boost_max_per_day = asInt(*v, "production.special_boost_max_per_day");
	}
	if (const auto *v = member(production, "shelf_life_days")) {
		config.production_.shelf_life_days = asIntMap(*v, "production.shelf_life_days");
	}

	const auto *store = section(document, "store");
	if (const auto *v = member(store, "vendor_weekday")) {
		config.store_.vendor_weekday = asWeekday(*v, "store.vendor_weekday");
	}
	if (const auto *v = member(store, "restock_lot_size")) {
		config.store_.restock_lot_size = asIntMap(*v, "store.restock_lot_size");
	}
	if (const auto *v = member(store, "service_level")) {
		config.store_.service_level = asDouble(*v, "store.service_level");
	}
	if (const auto *v = member(store, "lead_time_days")) {
		config.store_.lead_time_days = asInt(*v, "store.lead_time_days");
	}
	if (const auto *v = member(store, "start_stock")) {
		config.store_.start_stock = asIntMap(*v, "store.start_stock");
	}

	if (const auto *v = member(section(document, "suggestions"), "seed")) {
		config.suggestion_seed_ = asSeed(*v, "suggestions.seed");
	}

	if (const auto *v = member(section(document, "logging"), "level")) {
		if (!v->is_string()) {
			fail("logging.level", "expected a string.");
		}
		try {
			config.log_level_ = utils::Logging::parseLevel(v->get<std::string>());
		} catch (const std::invalid_argument &e) {
			fail("logging.level", e.what());
		}
	}

	config.validate();
	return config;
}

PipelineConfig PipelineConfig::withRecipe(inventory::Recipe recipe) {
	PipelineConfig config;
	config.production_.recipe = std::move(recipe);
	config.validate();
	return config;
}

void PipelineConfig::validate() const {
	if (production_.recipe.empty()) {
		fail("production.recipe", "must name at least one ingredient.");
	}
	if (forecast_.horizon_days < 0) {
		fail("forecast.horizon_days", "must be non-negative.");
	}
	if (!(forecast_.alpha > 0.0 && forecast_.alpha < 1.0)) {
		fail("forecast.alpha", "must be in (0, 1).");
	}
	if (forecast_.n_boot < 1) {
		fail("forecast.n_boot", "must be positive.");
	}
	for (double penalty : forecast_.penalties) {
		if (!std::isfinite(penalty) || penalty < 0.0) {
			fail("forecast.penalties", "penalties must be non-negative.");
		}
	}
	if (forecast_.cv_splits < 2) {
		fail("forecast.cv_splits", "must be at least 2.");
	}
	if (forecast_.holdout_days < 0) {
		fail("forecast.holdout_days", "must be non-negative.");
	}
	if (production_.special_boost_max_per_day < 0) {
		fail("production.special_boost_max_per_day", "must be non-negative.");
	}
	if (!(store_.service_level > 0.0 && store_.service_level < 1.0)) {
		fail("store.service_level", "must be in (0, 1).");
	}
	if (store_.lead_time_days <= 0) {
		fail("store.lead_time_days", "must be positive.");
	}
	checkIngredients(production_.shelf_life_days, production_.recipe, "production.shelf_life_days");
	checkIngredients(store_.restock_lot_size, production_.recipe, "store.restock_lot_size");
	checkIngredients(store_.start_stock, production_.recipe, "store.start_stock");
	for (const auto &entry : store_.start_stock) {
		if (entry.second < 0) {
			fail("store.start_stock." + entry.first, "must be non-negative.");
		}
	}
	for (const auto &entry : production_.shelf_life_days) {
		if (entry.second < 0) {
			fail("production.shelf_life_days." + entry.first, "must be non-negative.");
		}
	}
}

PipelineConfig PipelineConfig::withHorizon(int days) const {
	if (days < 0) {
		throw std::invalid_argument("Forecast horizon must be non-negative.");
	}
	PipelineConfig copy = *this;
	copy.forecast_.horizon_days = days;
	return copy;
}

forecasting::ForecastConfig PipelineConfig::forecastConfig() const {
	forecasting::ForecastConfig config;
	config.days_ahead = forecast_.horizon_days;
	config.cutoff_year = forecast_.cutoff_year;
	config.alpha = forecast_.alpha;
	config.n_boot = forecast_.n_boot;
	return config;
}

scheduling::SchedulerConfig PipelineConfig::schedulerConfig(const std::map<std::string, int> &observed_stock) const {
	scheduling::SchedulerConfig config;
	config.recipe = production_.recipe;
	config.special_days = production_.special_days;
	config.max_boost_per_day = production_.special_boost_max_per_day;
	config.shelf_life_days = production_.shelf_life_days;
	config.vendor_weekday = store_.vendor_weekday;
	config.lot_sizes = store_.restock_lot_size;
	config.service_level = store_.service_level;
	config.lead_time_days = store_.lead_time_days;
	config.suggestion_seed = suggestion_seed_;

	config.start_stock = store_.start_stock;
	for (const auto &entry : observed_stock) {
		if (production_.recipe.contains(entry.first) && config.start_stock.count(entry.first) == 0) {
			config.start_stock[entry.first] = std::max(entry.second, 0);
		}
	}
	return config;
}

} // namespace tastecast::config
