#pragma once

#include "pricecast/core/dataset.hpp"

#include <string>

namespace pricecast::models {

/**
 * @class LinearRegression
 * @brief Ordinary least squares with an intercept.
 *
 * The design matrix is centered before solving so the intercept is recovered
 * from the column means. Rank-deficient designs (e.g. duplicated indicator
 * columns) are handled by the column-pivoting QR solve.
 */
class LinearRegression final {
public:
	LinearRegression() = default;

	/// @throws std::invalid_argument If the inputs are empty or their row counts differ.
	void fit(const core::Matrix &features, const core::Vector &target);

	/// @throws std::runtime_error If called before fit.
	core::Vector predict(const core::Matrix &features) const;

	std::string getName() const {
		return "Linear Regression";
	}

	const core::Vector &coefficients() const noexcept {
		return coefficients_;
	}

	double intercept() const noexcept {
		return intercept_;
	}

private:
	core::Vector coefficients_;
	double intercept_ = 0.0;
	bool is_fitted_ = false;
};

} // namespace pricecast::models
