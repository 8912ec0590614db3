#pragma once

#include <cstddef>
#include <vector>

namespace pricecast::utils {

/**
 * @brief Descriptive statistics shared by the scalers, indicators and evaluators.
 */
namespace Statistics {

double mean(const std::vector<double> &data);

/**
 * @brief Standard deviation.
 * @param ddof Delta degrees of freedom (0 = population, 1 = sample).
 * @throws std::invalid_argument When data.size() <= ddof.
 */
double stddev(const std::vector<double> &data, std::size_t ddof = 0);

/**
 * @brief Compute median of a vector
 *
 * @param data Input data (will be modified for partial_sort)
 * @return Median value
 */
double median(std::vector<double> &data);

/**
 * @brief Quantile with linear interpolation between order statistics.
 *
 * @param data Input data (will be reordered)
 * @param q Probability in [0, 1]
 */
double quantile(std::vector<double> &data, double q);

} // namespace Statistics
} // namespace pricecast::utils
