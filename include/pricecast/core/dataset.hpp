#pragma once

#include "pricecast/core/calendar.hpp"

#include <Eigen/Dense>
#include <cstddef>
#include <string>
#include <vector>

namespace pricecast::core {

using Matrix = Eigen::MatrixXd;
using Vector = Eigen::VectorXd;

inline std::vector<double> toStdVector(const Vector &values) {
	return std::vector<double>(values.data(), values.data() + values.size());
}

/**
 * @struct Dataset
 * @brief A chronologically ordered feature matrix with its aligned target vector.
 *
 * Row i of @c features was built from the bars up to @c anchor_dates[i];
 * @c target[i] is the close @c horizon bars after that anchor. Row order is the
 * basis for temporal splitting and is never permuted in place.
 */
struct Dataset {
	std::vector<std::string> feature_names;
	Matrix features;
	Vector target;
	std::vector<Date> anchor_dates;

	std::size_t rows() const noexcept {
		return static_cast<std::size_t>(features.rows());
	}

	std::size_t cols() const noexcept {
		return static_cast<std::size_t>(features.cols());
	}

	/// Copies rows [first, last).
	Dataset slice(std::size_t first, std::size_t last) const;

	/// Copies the given rows in the given order.
	Dataset select(const std::vector<std::size_t> &indices) const;

	/// @throws std::invalid_argument If row counts or names disagree.
	void validate() const;
};

/**
 * @struct FeatureSet
 * @brief Output of feature construction.
 *
 * @c training holds every row whose features and target are defined. The
 * trailing @c horizon bars have defined features but no target yet; they are
 * kept in @c forecast_features as the anchors of a direct multi-step forecast.
 */
struct FeatureSet {
	Dataset training;
	Matrix forecast_features;
	std::vector<Date> forecast_anchor_dates;
	Date last_date{};
	int horizon = 0;
	std::size_t lookback = 0;
};

} // namespace pricecast::core
