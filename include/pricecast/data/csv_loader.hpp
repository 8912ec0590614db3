#pragma once

#include "pricecast/core/price_series.hpp"

#include <istream>
#include <string>
#include <vector>

namespace pricecast::data {

/**
 * @class CsvSeriesLoader
 * @brief Reads daily bars from a Date,Open,High,Low,Close[,Volume] CSV file.
 *
 * Header names are matched case-insensitively and in any order; other columns
 * (e.g. "Adj Close") are ignored. Dates are YYYY-MM-DD, optionally followed by
 * a time of day. A missing Volume column reads as zero volume.
 */
class CsvSeriesLoader {
public:
	/**
	 * @brief Parses bars in file order.
	 * @param source Name used in error messages.
	 * @throws std::runtime_error On a missing column or a malformed row (the message names the line).
	 */
	static std::vector<core::Bar> parse(std::istream &input, const std::string &source = "<stream>");

	/**
	 * @brief Loads a file into a series.
	 * @param sanitize Sort and de-duplicate dates instead of rejecting them.
	 * @throws std::runtime_error If the file cannot be opened or parsed.
	 * @throws core::InvalidSeriesError If @p sanitize is false and the dates are not strictly increasing.
	 */
	static core::PriceSeries load(const std::string &path, bool sanitize = true);
};

} // namespace pricecast::data
