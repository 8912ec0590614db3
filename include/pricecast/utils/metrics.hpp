#pragma once

#include <cmath>
#include <cstddef>
#include <limits>
#include <optional>
#include <stdexcept>
#include <vector>

namespace pricecast::utils {

struct AccuracyMetrics {
	double r2 = std::numeric_limits<double>::quiet_NaN();
	double mae = std::numeric_limits<double>::quiet_NaN();
	double mse = std::numeric_limits<double>::quiet_NaN();
	double rmse = std::numeric_limits<double>::quiet_NaN();
	std::size_t n = 0;
};

class Metrics final {
public:
	static double mae(const std::vector<double> &actual, const std::vector<double> &predicted);
	static double mse(const std::vector<double> &actual, const std::vector<double> &predicted);
	static double rmse(const std::vector<double> &actual, const std::vector<double> &predicted);

	/// Coefficient of determination; nullopt when the actual values have no variance.
	static std::optional<double> r2(const std::vector<double> &actual, const std::vector<double> &predicted);

	/**
	 * @brief R² with the convention used for constant targets.
	 *
	 * When the actual values are constant the score is 1.0 for a perfect
	 * prediction and 0.0 otherwise.
	 */
	static double r2Score(const std::vector<double> &actual, const std::vector<double> &predicted);

	static AccuracyMetrics score(const std::vector<double> &actual, const std::vector<double> &predicted);
};

} // namespace pricecast::utils
