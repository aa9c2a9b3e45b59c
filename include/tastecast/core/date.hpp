#pragma once

#include <cstdint>
#include <string>

namespace tastecast::core {

/**
 * @class Date
 * @brief A proleptic Gregorian calendar day, stored as a day count since 1970-01-01.
 *
 * Demand is recorded once per calendar day, so the pipeline never needs a time of
 * day. Weekdays follow the Monday = 0 ... Sunday = 6 convention used throughout
 * the library.
 */
class Date {
public:
	Date() = default;

	/**
	 * @brief Builds a date from its calendar fields.
	 * @throws std::invalid_argument If the fields do not name a real day.
	 */
	static Date fromYmd(int year, int month, int day);

	/// Builds a date from a day count relative to 1970-01-01.
	static Date fromDays(std::int64_t days_since_epoch) {
		Date date;
		date.days_ = days_since_epoch;
		return date;
	}

	/**
	 * @brief Parses an ISO "YYYY-MM-DD" date. A trailing time component ("T..." or " ...") is ignored.
	 * @throws std::invalid_argument On malformed input.
	 */
	static Date parse(const std::string &text);

	int year() const;
	int month() const;
	int day() const;

	/// Day of week, Monday = 0 ... Sunday = 6.
	int weekday() const;

	std::int64_t daysSinceEpoch() const {
		return days_;
	}

	/// ISO "YYYY-MM-DD" representation.
	std::string toString() const;

	Date operator+(std::int64_t days) const {
		return fromDays(days_ + days);
	}
	Date operator-(std::int64_t days) const {
		return fromDays(days_ - days);
	}
	std::int64_t operator-(const Date &other) const {
		return days_ - other.days_;
	}
	Date &operator+=(std::int64_t days) {
		days_ += days;
		return *this;
	}

	bool operator==(const Date &other) const {
		return days_ == other.days_;
	}
	bool operator!=(const Date &other) const {
		return days_ != other.days_;
	}
	bool operator<(const Date &other) const {
		return days_ < other.days_;
	}
	bool operator<=(const Date &other) const {
		return days_ <= other.days_;
	}
	bool operator>(const Date &other) const {
		return days_ > other.days_;
	}
	bool operator>=(const Date &other) const {
		return days_ >= other.days_;
	}

private:
	struct Civil {
		int year;
		unsigned month;
		unsigned day;
	};

	Civil civil() const;

	std::int64_t days_ = 0;
};

} // namespace tastecast::core
