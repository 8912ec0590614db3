#include "pricecast/utils/metrics.hpp"
#include <cmath>
#include <limits>
#include <numeric>

namespace pricecast::utils {

namespace {

void validate_lengths(const std::vector<double> &actual, const std::vector<double> &predicted) {
	if (actual.size() != predicted.size() || actual.empty()) {
		throw std::invalid_argument("Actual and predicted vectors must be non-empty and equal length.");
	}
}

// Rounding noise in a sum of n squares is bounded relative to the magnitude of the data
double roundingFloor(const std::vector<double> &actual) {
	double sum_sq = 0.0;
	for (double value : actual) {
		sum_sq += value * value;
	}
	return static_cast<double>(actual.size()) * std::numeric_limits<double>::epsilon() * sum_sq;
}

} // namespace

double Metrics::mae(const std::vector<double> &actual, const std::vector<double> &predicted) {
	validate_lengths(actual, predicted);
	double sum = 0.0;
	for (size_t i = 0; i < actual.size(); ++i) {
		sum += std::abs(actual[i] - predicted[i]);
	}
	return sum / static_cast<double>(actual.size());
}

double Metrics::mse(const std::vector<double> &actual, const std::vector<double> &predicted) {
	validate_lengths(actual, predicted);
	double sum = 0.0;
	for (size_t i = 0; i < actual.size(); ++i) {
		const double diff = actual[i] - predicted[i];
		sum += diff * diff;
	}
	return sum / static_cast<double>(actual.size());
}

double Metrics::rmse(const std::vector<double> &actual, const std::vector<double> &predicted) {
	return std::sqrt(mse(actual, predicted));
}

std::optional<double> Metrics::r2(const std::vector<double> &actual, const std::vector<double> &predicted) {
	validate_lengths(actual, predicted);

	const double mean_actual = std::accumulate(actual.begin(), actual.end(), 0.0) / static_cast<double>(actual.size());

	double ss_res = 0.0;
	double ss_tot = 0.0;
	for (size_t i = 0; i < actual.size(); ++i) {
		const double diff_res = actual[i] - predicted[i];
		ss_res += diff_res * diff_res;

		const double diff_tot = actual[i] - mean_actual;
		ss_tot += diff_tot * diff_tot;
	}

	if (ss_tot <= roundingFloor(actual)) {
		return std::nullopt;
	}

	return 1.0 - (ss_res / ss_tot);
}

double Metrics::r2Score(const std::vector<double> &actual, const std::vector<double> &predicted) {
	if (auto value = r2(actual, predicted)) {
		return *value;
	}
	const double ss_res = mse(actual, predicted) * static_cast<double>(actual.size());
	return ss_res <= roundingFloor(actual) ? 1.0 : 0.0;
}

AccuracyMetrics Metrics::score(const std::vector<double> &actual, const std::vector<double> &predicted) {
	AccuracyMetrics metrics;
	metrics.n = actual.size();
	metrics.r2 = r2Score(actual, predicted);
	metrics.mae = mae(actual, predicted);
	metrics.mse = mse(actual, predicted);
	metrics.rmse = std::sqrt(metrics.mse);
	return metrics;
}

} // namespace pricecast::utils
