#pragma once

#include <cstddef>
#include <vector>

namespace pricecast::features {

/**
 * @brief Technical indicators computed over a close-price buffer.
 *
 * Every function returns a vector aligned with its input. Positions without
 * enough history hold NaN, so position t only ever depends on values[0..t].
 */
namespace Indicators {

/// Simple moving average; defined from index window - 1.
std::vector<double> sma(const std::vector<double> &values, std::size_t window);

/**
 * @brief Exponential moving average with alpha = 2 / (window + 1).
 *
 * The recursion is seeded with the first value and reported from index
 * window - 1 onward.
 */
std::vector<double> ema(const std::vector<double> &values, std::size_t window);

/**
 * @brief Relative strength index with Wilder smoothing (alpha = 1 / window).
 *
 * Reported from index window - 1 onward; 100 when there are no losses.
 */
std::vector<double> rsi(const std::vector<double> &values, std::size_t window = 14);

/// MACD line: EMA(fast) - EMA(slow).
std::vector<double> macd(const std::vector<double> &values, std::size_t fast = 12, std::size_t slow = 26);

struct BollingerBands {
	std::vector<double> middle;
	std::vector<double> upper;
	std::vector<double> lower;
};

/// Bollinger bands around an SMA using the population standard deviation.
BollingerBands bollinger(const std::vector<double> &values, std::size_t window = 20, double num_std = 2.0);

/// Rolling sample standard deviation of simple returns; defined from index window.
std::vector<double> returnVolatility(const std::vector<double> &values, std::size_t window);

} // namespace Indicators
} // namespace pricecast::features
