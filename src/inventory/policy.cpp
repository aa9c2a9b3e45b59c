#include "tastecast/inventory/policy.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <cmath>
#include <stdexcept>

namespace tastecast::inventory {

namespace {

constexpr std::array<const char *, 7> kWeekdayNames = {"mon", "tue", "wed", "thu", "fri", "sat", "sun"};
constexpr double kStdFloor = 1e-6;

// Acklam's rational approximation of the inverse standard normal CDF.
double normalQuantile(double p) {
	if (std::abs(p - 0.5) < 1e-10) {
		return 0.0;
	}

	static const double a[] = {-3.969683028665376e1, 2.209460984245205e2,  -2.759285104469687e2,
	                           1.38357751867269e2,   -3.066479806614716e1, 2.506628277459239};
	static const double b[] = {-5.447609879822406e1, 1.615858368580409e2, -1.556989798598866e2, 6.680131188771972e1,
	                           -1.328068155288572e1};
	static const double c[] = {-7.784894002430293e-3, -3.223964580411365e-1, -2.400758277161838,
	                           -2.549732539343734,    4.374664141464968,     2.938163982698783};
	static const double d[] = {7.784695709041462e-3, 3.224671290700398e-1, 2.445134137142996, 3.754408661907416};
	constexpr double p_low = 0.02425;
	constexpr double p_high = 1.0 - p_low;

	if (p < p_low) {
		const double q = std::sqrt(-2.0 * std::log(p));
		return (((((c[0] * q + c[1]) * q + c[2]) * q + c[3]) * q + c[4]) * q + c[5]) /
		       ((((d[0] * q + d[1]) * q + d[2]) * q + d[3]) * q + 1.0);
	}
	if (p <= p_high) {
		const double q = p - 0.5;
		const double r = q * q;
		return (((((a[0] * r + a[1]) * r + a[2]) * r + a[3]) * r + a[4]) * r + a[5]) * q /
		       (((((b[0] * r + b[1]) * r + b[2]) * r + b[3]) * r + b[4]) * r + 1.0);
	}

	const double q = std::sqrt(-2.0 * std::log(1.0 - p));
	return -(((((c[0] * q + c[1]) * q + c[2]) * q + c[3]) * q + c[4]) * q + c[5]) /
	       ((((d[0] * q + d[1]) * q + d[2]) * q + d[3]) * q + 1.0);
}

std::string normalizeName(const std::string &raw) {
	auto begin = raw.begin();
	auto end = raw.end();
	while (begin != end && std::isspace(static_cast<unsigned char>(*begin))) {
		++begin;
	}
	while (end != begin && std::isspace(static_cast<unsigned char>(*(end - 1)))) {
		--end;
	}
	std::string name(begin, end);
	if (name.size() > 3) {
		name.resize(3);
	}
	std::transform(name.begin(), name.end(), name.begin(),
	               [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
	return name;
}

} // namespace

double zFromServiceLevel(double service_level) {
	if (!(service_level > 0.0 && service_level < 1.0)) {
		throw std::invalid_argument("Service level must be in (0, 1).");
	}
	return normalQuantile(service_level);
}

double safetyStock(double daily_demand_std, int lead_time_days, double service_level) {
	const double z = zFromServiceLevel(service_level);
	const double lead = static_cast<double>(std::max(lead_time_days, 0));
	return std::max(0.0, z * daily_demand_std * std::sqrt(lead));
}

double reorderPoint(double avg_daily_demand, int lead_time_days, double safety_stock) {
	return avg_daily_demand * static_cast<double>(lead_time_days) + safety_stock;
}

int roundUpLot(double qty, int lot_size) {
	if (lot_size <= 0) {
		return static_cast<int>(std::ceil(qty));
	}
	const double lot = static_cast<double>(lot_size);
	return static_cast<int>(std::ceil(qty / lot) * lot);
}

std::optional<int> parseWeekday(const WeekdaySpec &day) {
	if (const auto *index = std::get_if<int>(&day)) {
		if (*index >= 0 && *index <= 6) {
			return *index;
		}
		return std::nullopt;
	}
	const auto name = normalizeName(std::get<std::string>(day));
	for (std::size_t i = 0; i < kWeekdayNames.size(); ++i) {
		if (name == kWeekdayNames[i]) {
			return static_cast<int>(i);
		}
	}
	return std::nullopt;
}

std::vector<int> normalizeWeekdays(const std::vector<WeekdaySpec> &days) {
	std::vector<int> result;
	for (const auto &day : days) {
		if (const auto parsed = parseWeekday(day)) {
			result.push_back(*parsed);
		}
	}
	std::sort(result.begin(), result.end());
	result.erase(std::unique(result.begin(), result.end()), result.end());
	return result;
}

std::string weekdayName(int weekday) {
	if (weekday < 0 || weekday > 6) {
		throw std::out_of_range("Weekday index must be in [0, 6].");
	}
	std::string name = kWeekdayNames[static_cast<std::size_t>(weekday)];
	name[0] = static_cast<char>(std::toupper(static_cast<unsigned char>(name[0])));
	return name;
}

std::vector<double> rollingStdProxy(const std::vector<double> &values, std::size_t window) {
	if (window == 0) {
		throw std::invalid_argument("Rolling window must be positive.");
	}

	std::vector<double> proxy;
	proxy.reserve(values.size());
	for (std::size_t i = 0; i < values.size(); ++i) {
		const std::size_t begin = (i + 1 > window) ? i + 1 - window : 0;
		const std::size_t count = i + 1 - begin;

		double sum = 0.0;
		for (std::size_t j = begin; j <= i; ++j) {
			sum += values[j];
		}
		const double mean = sum / static_cast<double>(count);

		double std_dev = 0.0;
		if (count > 1) {
			double sq = 0.0;
			for (std::size_t j = begin; j <= i; ++j) {
				const double diff = values[j] - mean;
				sq += diff * diff;
			}
			std_dev = std::sqrt(sq / static_cast<double>(count - 1));
		}

		if (std_dev < kStdFloor) {
			const double fallback = 0.25 * mean;
			std_dev = (std::isfinite(fallback) && fallback > kStdFloor) ? fallback : 1.0;
		}
		proxy.push_back(std_dev);
	}
	return proxy;
}

} // namespace tastecast::inventory
