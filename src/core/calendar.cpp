#include "stockcast/core/calendar.hpp"

#include <cctype>
#include <cstdio>
#include <stdexcept>

namespace stockcast::core {

namespace {

// Civil date <-> day count conversions, shifted so that the year starts in March.
std::int64_t daysFromCivil(std::int64_t y, unsigned m, unsigned d) {
	y -= m <= 2 ? 1 : 0;
	const std::int64_t era = (y >= 0 ? y : y - 399) / 400;
	const auto yoe = static_cast<unsigned>(y - era * 400);
	const unsigned doy = (153 * (m > 2 ? m - 3 : m + 9) + 2) / 5 + d - 1;
	const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
	return era * 146097 + static_cast<std::int64_t>(doe) - 719468;
}

void civilFromDays(std::int64_t z, std::int64_t &year, unsigned &month, unsigned &day) {
	z += 719468;
	const std::int64_t era = (z >= 0 ? z : z - 146096) / 146097;
	const auto doe = static_cast<unsigned>(z - era * 146097);
	const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
	const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
	const unsigned mp = (5 * doy + 2) / 153;
	day = doy - (153 * mp + 2) / 5 + 1;
	month = mp < 10 ? mp + 3 : mp - 9;
	year = static_cast<std::int64_t>(yoe) + era * 400 + (month <= 2 ? 1 : 0);
}

bool isLeap(int year) {
	return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

long monthIndex(const Date &date) {
	return static_cast<long>(date.year()) * 12 + static_cast<long>(date.month()) - 1;
}

Date fromMonthIndex(long index, unsigned day) {
	long year = index / 12;
	long month0 = index % 12;
	if (month0 < 0) {
		month0 += 12;
		year -= 1;
	}
	const auto month = static_cast<unsigned>(month0 + 1);
	const unsigned last = daysInMonth(static_cast<int>(year), month);
	return Date(static_cast<int>(year), month, day > last ? last : day);
}

long floorDiv(long value, long divisor) {
	long q = value / divisor;
	if ((value % divisor != 0) && ((value < 0) != (divisor < 0))) {
		--q;
	}
	return q;
}

} // namespace

std::string toString(Interval interval) {
	switch (interval) {
	case Interval::Day:
		return "day";
	case Interval::Week:
		return "week";
	case Interval::Month:
		return "month";
	case Interval::Quarter:
		return "quarter";
	case Interval::Year:
		return "year";
	}
	throw std::invalid_argument("Unknown interval.");
}

Interval parseInterval(const std::string &key) {
	if (key == "day") {
		return Interval::Day;
	}
	if (key == "week") {
		return Interval::Week;
	}
	if (key == "month") {
		return Interval::Month;
	}
	if (key == "quarter") {
		return Interval::Quarter;
	}
	if (key == "year") {
		return Interval::Year;
	}
	throw std::invalid_argument("Unknown interval '" + key + "'. Expected day, week, month, quarter or year.");
}

unsigned daysInMonth(int year, unsigned month) {
	static const unsigned kDays[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
	if (month < 1 || month > 12) {
		throw std::invalid_argument("Month must be between 1 and 12.");
	}
	if (month == 2 && isLeap(year)) {
		return 29;
	}
	return kDays[month - 1];
}

Date::Date(int year, unsigned month, unsigned day) : year_(year), month_(month), day_(day) {
	if (month < 1 || month > 12) {
		throw std::invalid_argument("Month must be between 1 and 12.");
	}
	if (day < 1 || day > daysInMonth(year, month)) {
		throw std::invalid_argument("Day is out of range for the given month.");
	}
}

Date Date::fromDays(std::int64_t days) {
	std::int64_t year = 0;
	unsigned month = 1;
	unsigned day = 1;
	civilFromDays(days, year, month, day);
	return Date(static_cast<int>(year), month, day);
}

Date Date::parse(const std::string &text) {
	// YYYY-MM-DD, optionally followed by a time part which is ignored.
	if (text.size() < 10 || text[4] != '-' || text[7] != '-') {
		throw std::invalid_argument("Invalid date '" + text + "'. Expected YYYY-MM-DD.");
	}
	for (std::size_t i : {0u, 1u, 2u, 3u, 5u, 6u, 8u, 9u}) {
		if (!std::isdigit(static_cast<unsigned char>(text[i]))) {
			throw std::invalid_argument("Invalid date '" + text + "'. Expected YYYY-MM-DD.");
		}
	}
	if (text.size() > 10 && text[10] != ' ' && text[10] != 'T') {
		throw std::invalid_argument("Invalid date '" + text + "'. Expected YYYY-MM-DD.");
	}
	const int year = std::stoi(text.substr(0, 4));
	const auto month = static_cast<unsigned>(std::stoi(text.substr(5, 2)));
	const auto day = static_cast<unsigned>(std::stoi(text.substr(8, 2)));
	return Date(year, month, day);
}

std::int64_t Date::toDays() const {
	return daysFromCivil(year_, month_, day_);
}

unsigned Date::weekday() const {
	// 1970-01-01 was a Thursday.
	const std::int64_t shifted = (toDays() % 7 + 7 + 3) % 7;
	return static_cast<unsigned>(shifted);
}

std::string Date::toString() const {
	char buffer[16];
	std::snprintf(buffer, sizeof(buffer), "%04d-%02u-%02u", year_, month_, day_);
	return buffer;
}

Date Date::addMonths(long months) const {
	return fromMonthIndex(monthIndex(*this) + months, day_);
}

std::ostream &operator<<(std::ostream &out, const Date &date) {
	return out << date.toString();
}

Date truncate(const Date &date, Interval interval) {
	switch (interval) {
	case Interval::Day:
		return date;
	case Interval::Week:
		return date.addDays(-static_cast<std::int64_t>(date.weekday()));
	case Interval::Month:
		return Date(date.year(), date.month(), 1);
	case Interval::Quarter:
		return Date(date.year(), ((date.month() - 1) / 3) * 3 + 1, 1);
	case Interval::Year:
		return Date(date.year(), 1, 1);
	}
	throw std::invalid_argument("Unknown interval.");
}

Date advance(const Date &bucket, Interval interval, long steps) {
	switch (interval) {
	case Interval::Day:
		return bucket.addDays(steps);
	case Interval::Week:
		return bucket.addDays(static_cast<std::int64_t>(steps) * 7);
	case Interval::Month:
		return bucket.addMonths(steps);
	case Interval::Quarter:
		return bucket.addMonths(steps * 3);
	case Interval::Year:
		return bucket.addMonths(steps * 12);
	}
	throw std::invalid_argument("Unknown interval.");
}

long bucketDistance(const Date &from, const Date &to, Interval interval) {
	const Date start = truncate(from, interval);
	const Date end = truncate(to, interval);
	switch (interval) {
	case Interval::Day:
		return static_cast<long>(end.toDays() - start.toDays());
	case Interval::Week:
		return static_cast<long>((end.toDays() - start.toDays()) / 7);
	case Interval::Month:
		return monthIndex(end) - monthIndex(start);
	case Interval::Quarter:
		return (monthIndex(end) - monthIndex(start)) / 3;
	case Interval::Year:
		return static_cast<long>(end.year()) - static_cast<long>(start.year());
	}
	throw std::invalid_argument("Unknown interval.");
}

Date previousPeriodEnd(const Date &today, Interval interval) {
	switch (interval) {
	case Interval::Day:
		return today.addDays(-1);
	case Interval::Week:
		return today.addDays(-static_cast<std::int64_t>(today.weekday()) - 1);
	case Interval::Month: {
		const Date last_month = today.addMonths(-1);
		return Date(last_month.year(), last_month.month(), daysInMonth(last_month.year(), last_month.month()));
	}
	case Interval::Quarter: {
		const Date back = today.addMonths(-3);
		const unsigned quarter_end = static_cast<unsigned>(floorDiv(static_cast<long>(back.month()) - 1, 3) * 3 + 3);
		return Date(back.year(), quarter_end, daysInMonth(back.year(), quarter_end));
	}
	case Interval::Year:
		return Date(today.year() - 1, 12, 31);
	}
	throw std::invalid_argument("Unknown interval.");
}

} // namespace stockcast::core
