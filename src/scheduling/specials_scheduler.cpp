#include "tastecast/scheduling/specials_scheduler.hpp"
#include "tastecast/inventory/policy.hpp"
#include "tastecast/scheduling/suggestions.hpp"
#include "tastecast/utils/logging.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <iomanip>
#include <numeric>
#include <sstream>
#include <stdexcept>

namespace tastecast::scheduling {

namespace {

int roundUnits(double value) {
	return static_cast<int>(std::nearbyint(value));
}

double mean(const std::vector<double> &values, std::size_t begin, std::size_t end) {
	double sum = 0.0;
	for (std::size_t i = begin; i < end; ++i) {
		sum += values[i];
	}
	return sum / static_cast<double>(end - begin);
}

double sampleStd(const std::vector<double> &values, std::size_t begin, std::size_t end) {
	const double mu = mean(values, begin, end);
	double sq = 0.0;
	for (std::size_t i = begin; i < end; ++i) {
		const double diff = values[i] - mu;
		sq += diff * diff;
	}
	return std::sqrt(sq / static_cast<double>(end - begin - 1));
}

std::string upper(std::string text) {
	std::transform(text.begin(), text.end(), text.begin(),
	               [](unsigned char ch) { return static_cast<char>(std::toupper(ch)); });
	return text;
}

void checkKeys(const std::map<std::string, int> &values, const inventory::Recipe &recipe, const char *what) {
	for (const auto &entry : values) {
		if (!recipe.contains(entry.first)) {
			throw std::invalid_argument(std::string(what) + " names unknown ingredient '" + entry.first + "'.");
		}
	}
}

// Removes up to units from stock; returns the part that could not be served.
int consume(int &stock, int units) {
	const int served = std::min(stock, std::max(units, 0));
	stock -= served;
	return std::max(units, 0) - served;
}

} // namespace

void SchedulerConfig::validate() const {
	if (recipe.empty()) {
		throw std::invalid_argument("Scheduler requires a non-empty recipe.");
	}
	if (max_boost_per_day < 0) {
		throw std::invalid_argument("Promotion cap must be non-negative.");
	}
	if (lead_time_days <= 0) {
		throw std::invalid_argument("Lead time must be positive.");
	}
	if (!(service_level > 0.0 && service_level < 1.0)) {
		throw std::invalid_argument("Service level must be in (0, 1).");
	}
	for (int day : special_days) {
		if (day < 0 || day > 6) {
			throw std::invalid_argument("Special weekday must be in [0, 6].");
		}
	}
	if (vendor_weekday && (*vendor_weekday < 0 || *vendor_weekday > 6)) {
		throw std::invalid_argument("Vendor weekday must be in [0, 6].");
	}
	checkKeys(start_stock, recipe, "Start stock");
	checkKeys(lot_sizes, recipe, "Lot sizes");
	checkKeys(shelf_life_days, recipe, "Shelf life");
	for (const auto &entry : start_stock) {
		if (entry.second < 0) {
			throw std::invalid_argument("Start stock for '" + entry.first + "' must be non-negative.");
		}
	}
	for (const auto &entry : shelf_life_days) {
		if (entry.second < 0) {
			throw std::invalid_argument("Shelf life for '" + entry.first + "' must be non-negative.");
		}
	}
}

int SchedulerConfig::shelfLife(const std::string &ingredient) const {
	const auto it = shelf_life_days.find(ingredient);
	return it == shelf_life_days.end() ? kDefaultShelfLifeDays : it->second;
}

std::size_t ScheduleResult::countAdvisories(core::AdvisoryKind kind) const {
	return static_cast<std::size_t>(std::count_if(advisories.begin(), advisories.end(),
	                                              [kind](const core::Advisory &a) { return a.kind == kind; }));
}

SpecialsScheduler::SpecialsScheduler(SchedulerConfig config) : config_(std::move(config)) {
	config_.validate();
	std::sort(config_.special_days.begin(), config_.special_days.end());
	config_.special_days.erase(std::unique(config_.special_days.begin(), config_.special_days.end()),
	                           config_.special_days.end());
}

std::string SpecialsScheduler::formatPredictionSummary(const core::Prediction &prediction) {
	std::ostringstream oss;
	oss << std::fixed << std::setprecision(1) << "Pred " << prediction.mean << " (" << prediction.lower << "-"
	    << prediction.upper << ")";
	return oss.str();
}

ScheduleResult SpecialsScheduler::schedule(const std::vector<core::ForecastRecord> &forecast) const {
	std::vector<core::PlanDay> days;
	days.reserve(forecast.size());
	for (const auto &record : forecast) {
		days.push_back(core::PlanDay::fromForecast(record));
	}
	return schedule(std::move(days));
}

ScheduleResult SpecialsScheduler::schedule(std::vector<core::PlanDay> days) const {
	std::stable_sort(days.begin(), days.end(),
	                 [](const core::PlanDay &a, const core::PlanDay &b) { return a.date < b.date; });

	const auto &recipe = config_.recipe;
	const auto &ingredients = recipe.ingredients();
	const std::size_t n = days.size();
	const std::size_t n_ing = ingredients.size();
	const int lead = config_.lead_time_days;
	const std::size_t window = SchedulerConfig::kHistoryWindow;

	ScheduleResult result;
	result.plan.ingredients = ingredients;

	std::vector<int> stock(n_ing, 0);
	for (std::size_t k = 0; k < n_ing; ++k) {
		const auto it = config_.start_stock.find(ingredients[k]);
		stock[k] = it == config_.start_stock.end() ? 0 : it->second;
	}
	for (auto &day : days) {
		day.shortfall.assign(n_ing, 0);
	}

	// Demand statistics use the plan as passed in
	std::vector<double> baseline(n);
	for (std::size_t i = 0; i < n; ++i) {
		baseline[i] = static_cast<double>(days[i].qty_total);
	}
	const auto std_proxy = inventory::rollingStdProxy(baseline);
	const double whole_mean = n > 0 ? mean(baseline, 0, n) : 0.0;

	auto attachPrediction = [](core::Advisory &advisory, const core::PlanDay &day) {
		if (!day.prediction) {
			return;
		}
		advisory.prediction = day.prediction;
		advisory.pred_summary = formatPredictionSummary(*day.prediction);
		advisory.message += " - " + *advisory.pred_summary;
	};

	for (std::size_t i = 0; i < n; ++i) {
		auto &day = days[i];
		const int weekday = day.date.weekday();

		if (config_.vendor_weekday && weekday == *config_.vendor_weekday) {
			const std::size_t hist_begin = i > window ? i - window : 0;
			const std::size_t hist_len = i - hist_begin;
			const double hist_mean = hist_len > 0 ? mean(baseline, hist_begin, i) : whole_mean;
			const double hist_std = hist_len > 1 ? sampleStd(baseline, hist_begin, i) : std_proxy[i > 0 ? i - 1 : 0];

			int lead_items = 0;
			for (std::size_t j = i; j < std::min(n, i + static_cast<std::size_t>(lead)); ++j) {
				lead_items += days[j].qty_total;
			}

			for (std::size_t k = 0; k < n_ing; ++k) {
				const auto &ing = ingredients[k];
				const double ratio = recipe.ratioAt(k);

				RestockCheck check;
				check.date = day.date;
				check.ingredient = ing;
				check.stock_before = stock[k];
				check.avg_daily = hist_mean * ratio;
				check.safety = inventory::safetyStock(hist_std * ratio, lead, config_.service_level);
				check.reorder_point = inventory::reorderPoint(check.avg_daily, lead, check.safety);

				if (check.belowReorderPoint()) {
					check.target = static_cast<double>(lead_items) * ratio + check.safety + ratio;
					const auto lot = config_.lot_sizes.find(ing);
					check.ordered = inventory::roundUpLot(std::max(0.0, check.target - stock[k]),
					                                      lot == config_.lot_sizes.end() ? 0 : lot->second);
					if (check.ordered > 0) {
						std::ostringstream msg;
						msg << day.date.toString() << ": BUY " << check.ordered << " " << ing << " (stock "
						    << stock[k] << " < ROP " << roundUnits(check.reorder_point)
						    << "). Target cover=" << roundUnits(check.target) << ".";

						core::Advisory advisory;
						advisory.date = day.date;
						advisory.kind = core::AdvisoryKind::Buy;
						advisory.type = "BUY_" + upper(ing);
						advisory.ingredient = ing;
						advisory.qty = check.ordered;
						advisory.message = msg.str();
						advisory.reason = "below_ROP";
						attachPrediction(advisory, day);
						result.advisories.push_back(std::move(advisory));
						stock[k] += check.ordered;
					}
				}
				TASTECAST_DEBUG("{} restock {}: stock={} rop={:.2f} safety={:.2f} ordered={}", day.date.toString(),
				                ing, check.stock_before, check.reorder_point, check.safety, check.ordered);
				result.restock_checks.push_back(std::move(check));
			}
		}

		for (std::size_t k = 0; k < n_ing; ++k) {
			const int missing = consume(stock[k], roundUnits(static_cast<double>(day.qty_total) * recipe.ratioAt(k)));
			if (missing > 0) {
				day.shortfall[k] += missing;
				TASTECAST_DEBUG("{} {} short by {} units; stock floored at 0.", day.date.toString(), ingredients[k],
				                missing);
			}
		}

		if (!std::binary_search(config_.special_days.begin(), config_.special_days.end(), weekday)) {
			continue;
		}

		const std::size_t hist_begin = i > window ? i - window : 0;
		const double hist_std = (i + 1 - hist_begin) > 1 ? sampleStd(baseline, hist_begin, i + 1) : std_proxy[i];

		std::vector<SurplusCheck> checks(n_ing);
		for (std::size_t k = 0; k < n_ing; ++k) {
			const double ratio = recipe.ratioAt(k);
			const auto expiry = static_cast<std::size_t>(lead + config_.shelfLife(ingredients[k]) / 2);

			double future_items = 0.0;
			for (std::size_t j = i + 1; j < std::min(n, i + 1 + expiry); ++j) {
				future_items += static_cast<double>(days[j].qty_total);
			}

			auto &check = checks[k];
			check.date = day.date;
			check.ingredient = ingredients[k];
			check.stock = stock[k];
			check.future_need = roundUnits(future_items * ratio);
			check.safety = inventory::safetyStock(hist_std * ratio, lead, config_.service_level);
			check.surplus = static_cast<double>(stock[k]) - check.future_need - check.safety;
		}

		std::vector<std::size_t> order(n_ing);
		std::iota(order.begin(), order.end(), 0);
		std::stable_sort(order.begin(), order.end(),
		                 [&checks](std::size_t a, std::size_t b) { return checks[a].surplus > checks[b].surplus; });

		for (std::size_t k : order) {
			auto &check = checks[k];
			const double ratio = recipe.ratioAt(k);
			check.capacity_left = config_.max_boost_per_day - day.special_added;
			if (check.surplus <= 0.0 || ratio <= 0.0) {
				continue;
			}
			const auto extra = static_cast<int>(std::floor(check.surplus / ratio));
			if (extra <= 0 || check.capacity_left <= 0) {
				continue;
			}
			const int add = std::min(check.capacity_left, extra);
			if (static_cast<double>(stock[k]) - add * ratio < 0.0) {
				continue;
			}

			day.special_added += add;
			day.qty_total += add;
			for (std::size_t m = 0; m < n_ing; ++m) {
				day.shortfall[m] += consume(stock[m], roundUnits(add * recipe.ratioAt(m)));
			}
			check.added = add;

			const auto picks = suggestions(check.ingredient, config_.suggestion_count, config_.suggestion_seed);
			std::ostringstream msg;
			msg << day.date.toString() << ": Scheduled " << add << " extra items to burn surplus of "
			    << check.ingredient << ".";

			core::Advisory advisory;
			advisory.date = day.date;
			advisory.kind = core::AdvisoryKind::Special;
			advisory.type = "SPECIAL_" + upper(check.ingredient);
			advisory.ingredient = check.ingredient;
			advisory.special_qty = add;
			advisory.suggestions = joinSuggestions(picks);
			advisory.message = msg.str();
			advisory.reason = "surplus_burn";
			attachPrediction(advisory, day);
			result.advisories.push_back(std::move(advisory));
		}

		for (auto &check : checks) {
			TASTECAST_DEBUG("{} surplus {}: stock={} future_need={} safety={:.2f} surplus={:.2f} added={}",
			                check.date.toString(), check.ingredient, check.stock, check.future_need, check.safety,
			                check.surplus, check.added);
			result.surplus_checks.push_back(std::move(check));
		}
	}

	for (auto &day : days) {
		day.needs = recipe.neededForItems(static_cast<double>(day.qty_total));
	}

	std::stable_sort(result.advisories.begin(), result.advisories.end(),
	                 [](const core::Advisory &a, const core::Advisory &b) {
		                 if (a.date != b.date) {
			                 return a.date < b.date;
		                 }
		                 return a.type < b.type;
	                 });

	TASTECAST_INFO("Scheduled {} days: {} BUY and {} SPECIAL advisories.", n,
	               result.countAdvisories(core::AdvisoryKind::Buy), result.countAdvisories(core::AdvisoryKind::Special));

	result.plan.days = std::move(days);
	return result;
}

} // namespace tastecast::scheduling
