#include "pricecast/core/calendar.hpp"

#include <cstdio>
#include <stdexcept>

namespace pricecast::core {

namespace {

// Days since 1970-01-01 for a civil date (H. Hinnant's algorithm).
long long daysFromCivil(long long y, unsigned m, unsigned d) {
	y -= m <= 2 ? 1 : 0;
	const long long era = (y >= 0 ? y : y - 399) / 400;
	const unsigned yoe = static_cast<unsigned>(y - era * 400);
	const unsigned doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
	const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
	return era * 146097 + static_cast<long long>(doe) - 719468;
}

void civilFromDays(long long z, int &year, unsigned &month, unsigned &day) {
	z += 719468;
	const long long era = (z >= 0 ? z : z - 146096) / 146097;
	const unsigned doe = static_cast<unsigned>(z - era * 146097);
	const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
	const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
	const unsigned mp = (5 * doy + 2) / 153;
	day = doy - (153 * mp + 2) / 5 + 1;
	month = mp < 10 ? mp + 3 : mp - 9;
	year = static_cast<int>(static_cast<long long>(yoe) + era * 400 + (month <= 2 ? 1 : 0));
}

bool isLeapYear(int year) {
	return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

unsigned daysInMonth(int year, unsigned month) {
	static constexpr unsigned kDays[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
	if (month == 2 && isLeapYear(year)) {
		return 29;
	}
	return kDays[month - 1];
}

} // namespace

Date makeDate(int year, unsigned month, unsigned day) {
	if (month < 1 || month > 12) {
		throw std::invalid_argument("Month must be in [1, 12].");
	}
	if (day < 1 || day > daysInMonth(year, month)) {
		throw std::invalid_argument("Day is out of range for the given month.");
	}
	return Date{} + std::chrono::duration_cast<Date::duration>(Days(daysFromCivil(year, month, day)));
}

Date parseDate(const std::string &text) {
	int year = 0;
	unsigned month = 0;
	unsigned day = 0;
	int consumed = 0;
	if (std::sscanf(text.c_str(), "%d-%u-%u%n", &year, &month, &day, &consumed) != 3) {
		throw std::invalid_argument("Invalid date '" + text + "', expected YYYY-MM-DD.");
	}
	const auto rest = text.substr(static_cast<std::size_t>(consumed));
	if (!rest.empty() && rest.front() != ' ' && rest.front() != 'T') {
		throw std::invalid_argument("Invalid date '" + text + "', expected YYYY-MM-DD.");
	}
	try {
		return makeDate(year, month, day);
	} catch (const std::invalid_argument &) {
		throw std::invalid_argument("Invalid calendar date '" + text + "'.");
	}
}

std::string formatDate(const Date &date) {
	const auto days = std::chrono::floor<Days>(date.time_since_epoch()).count();
	int year = 0;
	unsigned month = 0;
	unsigned day = 0;
	civilFromDays(days, year, month, day);
	char buffer[16];
	std::snprintf(buffer, sizeof(buffer), "%04d-%02u-%02u", year, month, day);
	return buffer;
}

} // namespace pricecast::core
