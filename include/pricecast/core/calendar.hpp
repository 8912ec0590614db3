#pragma once

#include <chrono>
#include <string>

namespace pricecast::core {

using Date = std::chrono::system_clock::time_point;
using Days = std::chrono::duration<long long, std::ratio<86400>>;

/**
 * @brief Builds a UTC midnight time point for a proleptic Gregorian calendar date.
 * @throws std::invalid_argument If month or day are out of range.
 */
Date makeDate(int year, unsigned month, unsigned day);

/**
 * @brief Parses an ISO-8601 calendar date (YYYY-MM-DD).
 *
 * A trailing time component ("2024-01-02 00:00:00" or "2024-01-02T00:00:00") is
 * accepted and ignored.
 * @throws std::invalid_argument If the text is not a valid date.
 */
Date parseDate(const std::string &text);

/// Formats a time point as YYYY-MM-DD (UTC).
std::string formatDate(const Date &date);

/// Advances @p date by @p days whole calendar days.
inline Date addDays(const Date &date, long long days) {
	return date + std::chrono::duration_cast<Date::duration>(Days(days));
}

} // namespace pricecast::core
