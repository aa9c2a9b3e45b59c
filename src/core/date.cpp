#include "tastecast/core/date.hpp"

#include <cctype>
#include <cstdio>
#include <stdexcept>

namespace tastecast::core {

namespace {

bool isLeapYear(int year) {
	return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

int daysInMonth(int year, int month) {
	static const int kDays[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
	if (month == 2 && isLeapYear(year)) {
		return 29;
	}
	return kDays[month - 1];
}

// Days from 1970-01-01 to y-m-d in the proleptic Gregorian calendar (era-based).
std::int64_t daysFromCivil(int y, unsigned m, unsigned d) {
	y -= m <= 2 ? 1 : 0;
	const std::int64_t era = (y >= 0 ? y : y - 399) / 400;
	const unsigned yoe = static_cast<unsigned>(y - era * 400);
	const unsigned doy = (153 * (m > 2 ? m - 3 : m + 9) + 2) / 5 + d - 1;
	const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
	return era * 146097 + static_cast<std::int64_t>(doe) - 719468;
}

int parseDigits(const std::string &text, std::size_t pos, std::size_t count) {
	int value = 0;
	for (std::size_t i = pos; i < pos + count; ++i) {
		const unsigned char c = static_cast<unsigned char>(text[i]);
		if (!std::isdigit(c)) {
			throw std::invalid_argument("Malformed date '" + text + "', expected YYYY-MM-DD.");
		}
		value = value * 10 + (c - '0');
	}
	return value;
}

} // namespace

Date Date::fromYmd(int year, int month, int day) {
	if (month < 1 || month > 12) {
		throw std::invalid_argument("Month must be in [1, 12].");
	}
	if (day < 1 || day > daysInMonth(year, month)) {
		throw std::invalid_argument("Day out of range for the given month.");
	}
	return fromDays(daysFromCivil(year, static_cast<unsigned>(month), static_cast<unsigned>(day)));
}

Date Date::parse(const std::string &text) {
	if (text.size() < 10 || text[4] != '-' || text[7] != '-') {
		throw std::invalid_argument("Malformed date '" + text + "', expected YYYY-MM-DD.");
	}
	if (text.size() > 10 && text[10] != 'T' && text[10] != ' ') {
		throw std::invalid_argument("Malformed date '" + text + "', expected YYYY-MM-DD.");
	}
	const int year = parseDigits(text, 0, 4);
	const int month = parseDigits(text, 5, 2);
	const int day = parseDigits(text, 8, 2);
	return fromYmd(year, month, day);
}

Date::Civil Date::civil() const {
	const std::int64_t z = days_ + 719468;
	const std::int64_t era = (z >= 0 ? z : z - 146096) / 146097;
	const unsigned doe = static_cast<unsigned>(z - era * 146097);
	const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
	const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
	const unsigned mp = (5 * doy + 2) / 153;
	const unsigned d = doy - (153 * mp + 2) / 5 + 1;
	const unsigned m = mp < 10 ? mp + 3 : mp - 9;
	const std::int64_t y = static_cast<std::int64_t>(yoe) + era * 400 + (m <= 2 ? 1 : 0);
	return Civil {static_cast<int>(y), m, d};
}

int Date::year() const {
	return civil().year;
}

int Date::month() const {
	return static_cast<int>(civil().month);
}

int Date::day() const {
	return static_cast<int>(civil().day);
}

int Date::weekday() const {
	// 1970-01-01 was a Thursday (Monday-based index 3).
	const std::int64_t shifted = (days_ + 3) % 7;
	return static_cast<int>(shifted < 0 ? shifted + 7 : shifted);
}

std::string Date::toString() const {
	const auto c = civil();
	char buffer[16];
	std::snprintf(buffer, sizeof(buffer), "%04d-%02u-%02u", c.year, c.month, c.day);
	return std::string(buffer);
}

} // namespace tastecast::core
