#include "pricecast/models/linear_regression.hpp"
#include "pricecast/utils/logging.hpp"

#include <stdexcept>
#include <string>

namespace pricecast::models {

void LinearRegression::fit(const core::Matrix &features, const core::Vector &target) {
	if (features.rows() == 0 || features.cols() == 0) {
		throw std::invalid_argument("Cannot fit a linear regression on an empty design matrix.");
	}
	if (features.rows() != target.size()) {
		throw std::invalid_argument("Feature matrix and target vector must have the same number of rows.");
	}

	const Eigen::RowVectorXd means = features.colwise().mean();
	const double target_mean = target.mean();
	const core::Matrix centered = features.rowwise() - means;
	const core::Vector centered_target = (target.array() - target_mean).matrix();

	coefficients_ = centered.colPivHouseholderQr().solve(centered_target);
	intercept_ = target_mean - means.transpose().dot(coefficients_);
	is_fitted_ = true;
	PRICECAST_DEBUG("Linear regression fitted on {} rows x {} features.", features.rows(), features.cols());
}

core::Vector LinearRegression::predict(const core::Matrix &features) const {
	if (!is_fitted_) {
		throw std::runtime_error("Predict called before fit.");
	}
	if (features.cols() != coefficients_.size()) {
		throw std::invalid_argument("Expected " + std::to_string(coefficients_.size()) + " features, got " +
		                            std::to_string(features.cols()) + ".");
	}
	return ((features * coefficients_).array() + intercept_).matrix();
}

} // namespace pricecast::models
