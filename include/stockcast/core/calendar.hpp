#pragma once

#include <cstdint>
#include <ostream>
#include <string>

namespace stockcast::core {

/**
 * @brief Granularity of a demand bucket.
 */
enum class Interval {
	Day,
	Week,
	Month,
	Quarter,
	Year
};

std::string toString(Interval interval);

/**
 * @brief Parses an interval key ("day", "week", "month", "quarter", "year").
 * @throws std::invalid_argument for unknown keys.
 */
Interval parseInterval(const std::string &key);

/**
 * @class Date
 * @brief A proleptic Gregorian calendar date without time of day.
 *
 * Dates are stored as year/month/day and convert to a day count relative to
 * 1970-01-01, which is what bucket arithmetic works on.
 */
class Date {
public:
	Date() = default;

	/**
	 * @brief Constructs a date from its civil components.
	 * @throws std::invalid_argument If the month or day is out of range.
	 */
	Date(int year, unsigned month, unsigned day);

	/// Builds a date from the number of days since 1970-01-01.
	static Date fromDays(std::int64_t days);

	/**
	 * @brief Parses an ISO-8601 calendar date ("YYYY-MM-DD").
	 * @throws std::invalid_argument If the text is not a valid date.
	 */
	static Date parse(const std::string &text);

	std::int64_t toDays() const;

	int year() const {
		return year_;
	}
	unsigned month() const {
		return month_;
	}
	unsigned day() const {
		return day_;
	}

	/// Day of week, Monday = 0 ... Sunday = 6.
	unsigned weekday() const;

	std::string toString() const;

	Date addDays(std::int64_t days) const {
		return fromDays(toDays() + days);
	}

	/// Adds calendar months, clamping the day to the length of the target month.
	Date addMonths(long months) const;

	friend bool operator==(const Date &lhs, const Date &rhs) {
		return lhs.year_ == rhs.year_ && lhs.month_ == rhs.month_ && lhs.day_ == rhs.day_;
	}
	friend bool operator!=(const Date &lhs, const Date &rhs) {
		return !(lhs == rhs);
	}
	friend bool operator<(const Date &lhs, const Date &rhs) {
		return lhs.toDays() < rhs.toDays();
	}
	friend bool operator>(const Date &lhs, const Date &rhs) {
		return rhs < lhs;
	}
	friend bool operator<=(const Date &lhs, const Date &rhs) {
		return !(rhs < lhs);
	}
	friend bool operator>=(const Date &lhs, const Date &rhs) {
		return !(lhs < rhs);
	}

private:
	int year_ = 1970;
	unsigned month_ = 1;
	unsigned day_ = 1;
};

std::ostream &operator<<(std::ostream &out, const Date &date);

unsigned daysInMonth(int year, unsigned month);

/**
 * @brief Maps a date to the first day of its bucket.
 *
 * Weeks start on Monday, quarters on January, April, July and October.
 */
Date truncate(const Date &date, Interval interval);

/// Moves a bucket start @p steps buckets forward (or backward for negative steps).
Date advance(const Date &bucket, Interval interval, long steps);

/**
 * @brief Number of whole buckets from @p from to @p to.
 *
 * Both arguments are truncated first, so the result is exact for any dates.
 */
long bucketDistance(const Date &from, const Date &to, Interval interval);

/**
 * @brief Last day of the most recent complete bucket before @p today.
 *
 * This is the default series end offered to users: yesterday for daily data,
 * the previous Sunday for weekly data, the end of the previous month, the end
 * of the quarter three months back, and December 31 of the previous year.
 */
Date previousPeriodEnd(const Date &today, Interval interval);

} // namespace stockcast::core
