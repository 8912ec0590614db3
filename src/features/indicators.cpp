#include "pricecast/features/indicators.hpp"

#include <cmath>
#include <limits>
#include <stdexcept>

namespace pricecast::features {

namespace Indicators {

namespace {

constexpr double kNaN = std::numeric_limits<double>::quiet_NaN();

void requireWindow(std::size_t window) {
	if (window == 0) {
		throw std::invalid_argument("Indicator window must be positive.");
	}
}

} // namespace

std::vector<double> sma(const std::vector<double> &values, std::size_t window) {
	requireWindow(window);
	std::vector<double> out(values.size(), kNaN);
	for (std::size_t t = window - 1; t < values.size(); ++t) {
		double sum = 0.0;
		for (std::size_t k = t + 1 - window; k <= t; ++k) {
			sum += values[k];
		}
		out[t] = sum / static_cast<double>(window);
	}
	return out;
}

std::vector<double> ema(const std::vector<double> &values, std::size_t window) {
	requireWindow(window);
	std::vector<double> out(values.size(), kNaN);
	if (values.empty()) {
		return out;
	}
	const double alpha = 2.0 / (static_cast<double>(window) + 1.0);
	double state = values.front();
	for (std::size_t t = 0; t < values.size(); ++t) {
		if (t > 0) {
			state = alpha * values[t] + (1.0 - alpha) * state;
		}
		if (t + 1 >= window) {
			out[t] = state;
		}
	}
	return out;
}

std::vector<double> rsi(const std::vector<double> &values, std::size_t window) {
	requireWindow(window);
	std::vector<double> out(values.size(), kNaN);
	if (values.empty()) {
		return out;
	}
	const double alpha = 1.0 / static_cast<double>(window);
	double avg_gain = 0.0;
	double avg_loss = 0.0;
	for (std::size_t t = 0; t < values.size(); ++t) {
		const double change = t == 0 ? 0.0 : values[t] - values[t - 1];
		const double gain = change > 0.0 ? change : 0.0;
		const double loss = change < 0.0 ? -change : 0.0;
		if (t == 0) {
			avg_gain = gain;
			avg_loss = loss;
		} else {
			avg_gain = alpha * gain + (1.0 - alpha) * avg_gain;
			avg_loss = alpha * loss + (1.0 - alpha) * avg_loss;
		}
		if (t + 1 < window) {
			continue;
		}
		if (avg_loss <= 0.0) {
			out[t] = avg_gain <= 0.0 ? 50.0 : 100.0;
		} else {
			const double rs = avg_gain / avg_loss;
			out[t] = 100.0 - 100.0 / (1.0 + rs);
		}
	}
	return out;
}

std::vector<double> macd(const std::vector<double> &values, std::size_t fast, std::size_t slow) {
	if (fast >= slow) {
		throw std::invalid_argument("MACD fast window must be shorter than the slow window.");
	}
	const auto fast_ema = ema(values, fast);
	const auto slow_ema = ema(values, slow);
	std::vector<double> out(values.size(), kNaN);
	for (std::size_t t = 0; t < values.size(); ++t) {
		out[t] = fast_ema[t] - slow_ema[t];
	}
	return out;
}

BollingerBands bollinger(const std::vector<double> &values, std::size_t window, double num_std) {
	requireWindow(window);
	BollingerBands bands;
	bands.middle = sma(values, window);
	bands.upper.assign(values.size(), kNaN);
	bands.lower.assign(values.size(), kNaN);
	for (std::size_t t = window - 1; t < values.size(); ++t) {
		const double mean = bands.middle[t];
		double sum_sq = 0.0;
		for (std::size_t k = t + 1 - window; k <= t; ++k) {
			const double diff = values[k] - mean;
			sum_sq += diff * diff;
		}
		const double sd = std::sqrt(sum_sq / static_cast<double>(window));
		bands.upper[t] = mean + num_std * sd;
		bands.lower[t] = mean - num_std * sd;
	}
	return bands;
}

std::vector<double> returnVolatility(const std::vector<double> &values, std::size_t window) {
	if (window < 2) {
		throw std::invalid_argument("Volatility window must be at least 2.");
	}
	std::vector<double> out(values.size(), kNaN);
	std::vector<double> returns(window);
	for (std::size_t t = window; t < values.size(); ++t) {
		double mean = 0.0;
		for (std::size_t k = 0; k < window; ++k) {
			const std::size_t idx = t + 1 - window + k;
			returns[k] = values[idx] / values[idx - 1] - 1.0;
			mean += returns[k];
		}
		mean /= static_cast<double>(window);
		double sum_sq = 0.0;
		for (double ret : returns) {
			sum_sq += (ret - mean) * (ret - mean);
		}
		out[t] = std::sqrt(sum_sq / static_cast<double>(window - 1));
	}
	return out;
}

} // namespace Indicators
} // namespace pricecast::features
