#include "pricecast/utils/statistics.hpp"
#include <algorithm>
#include <cmath>
#include <numeric>
#include <stdexcept>

namespace pricecast::utils {

namespace Statistics {

double mean(const std::vector<double> &data) {
	if (data.empty()) {
		throw std::invalid_argument("Cannot compute mean of empty vector");
	}
	return std::accumulate(data.begin(), data.end(), 0.0) / static_cast<double>(data.size());
}

double stddev(const std::vector<double> &data, std::size_t ddof) {
	if (data.size() <= ddof) {
		throw std::invalid_argument("Not enough values for standard deviation");
	}
	const double mu = mean(data);
	double sum_sq = 0.0;
	for (double value : data) {
		const double diff = value - mu;
		sum_sq += diff * diff;
	}
	return std::sqrt(sum_sq / static_cast<double>(data.size() - ddof));
}

double median(std::vector<double> &data) {
	if (data.empty()) {
		throw std::invalid_argument("Cannot compute median of empty vector");
	}

	size_t n = data.size();
	size_t mid = n / 2;

	// Use nth_element for O(n) median (partial sort)
	std::nth_element(data.begin(), data.begin() + mid, data.end());

	if (n % 2 == 1) {
		return data[mid];
	}
	// Even number of elements: average with the maximum of the lower half
	double mid_val = data[mid];
	auto lower_max = *std::max_element(data.begin(), data.begin() + mid);
	return (lower_max + mid_val) / 2.0;
}

double quantile(std::vector<double> &data, double q) {
	if (data.empty()) {
		throw std::invalid_argument("Cannot compute quantile of empty vector");
	}
	if (q < 0.0 || q > 1.0) {
		throw std::invalid_argument("Quantile probability must be in [0, 1]");
	}

	std::sort(data.begin(), data.end());
	const double position = q * static_cast<double>(data.size() - 1);
	const auto lower = static_cast<std::size_t>(std::floor(position));
	const auto upper = std::min(lower + 1, data.size() - 1);
	const double weight = position - static_cast<double>(lower);
	return data[lower] + weight * (data[upper] - data[lower]);
}

} // namespace Statistics
} // namespace pricecast::utils
