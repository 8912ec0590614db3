#include "pricecast/transform/scaler.hpp"
#include "pricecast/utils/logging.hpp"
#include "pricecast/utils/statistics.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <limits>
#include <stdexcept>

namespace pricecast::transform {

namespace {

bool isDegenerate(double center, double scale) {
	if (!std::isfinite(scale) || !std::isfinite(center)) {
		return true;
	}
	return std::abs(scale) <= std::numeric_limits<double>::epsilon() * std::max(1.0, std::abs(center));
}

} // namespace

ScalingMethod parseScalingMethod(const std::string &name) {
	std::string lower;
	lower.reserve(name.size());
	for (char ch : name) {
		lower.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(ch))));
	}
	if (lower == "none" || lower == "identity") {
		return ScalingMethod::None;
	}
	if (lower == "standard") {
		return ScalingMethod::Standard;
	}
	if (lower == "robust") {
		return ScalingMethod::Robust;
	}
	if (lower == "minmax") {
		return ScalingMethod::MinMax;
	}
	throw std::invalid_argument("Unknown scaling method '" + name + "'.");
}

std::string toString(ScalingMethod method) {
	switch (method) {
	case ScalingMethod::None:
		return "none";
	case ScalingMethod::Standard:
		return "standard";
	case ScalingMethod::Robust:
		return "robust";
	case ScalingMethod::MinMax:
		return "minmax";
	}
	return "?";
}

// ============================================================================
// Scaler
// ============================================================================

void Scaler::fit(const core::Matrix &data, const std::vector<std::string> &feature_names) {
	if (data.rows() == 0) {
		throw std::invalid_argument("Cannot fit a scaler on an empty matrix.");
	}

	ScaleParams params;
	const auto cols = static_cast<std::size_t>(data.cols());
	params.center.resize(cols);
	params.scale.resize(cols);

	std::vector<double> column(static_cast<std::size_t>(data.rows()));
	for (std::size_t c = 0; c < cols; ++c) {
		const auto col = static_cast<Eigen::Index>(c);
		for (Eigen::Index r = 0; r < data.rows(); ++r) {
			column[static_cast<std::size_t>(r)] = data(r, col);
		}
		auto [center, scale] = columnParams(column);
		if (method() != ScalingMethod::None && isDegenerate(center, scale)) {
			// Zero spread: leave this feature unscaled rather than divide by zero
			const auto name = c < feature_names.size() ? feature_names[c] : "#" + std::to_string(c);
			PRICECAST_WARN("Numeric instability: feature '{}' has zero spread under {} scaling; left unscaled.",
			               name, toString(method()));
			params.degenerate.push_back(c);
			center = 0.0;
			scale = 1.0;
		}
		params.center[c] = center;
		params.scale[c] = scale;
	}
	params_ = std::move(params);
}

void Scaler::transform(core::Matrix &data) const {
	ensureParams();
	if (static_cast<std::size_t>(data.cols()) != params_->center.size()) {
		throw std::invalid_argument("Matrix has " + std::to_string(data.cols()) + " columns, scaler was fitted on " +
		                            std::to_string(params_->center.size()) + ".");
	}
	for (Eigen::Index c = 0; c < data.cols(); ++c) {
		const auto idx = static_cast<std::size_t>(c);
		data.col(c) = ((data.col(c).array() - params_->center[idx]) / params_->scale[idx]).matrix();
	}
}

void Scaler::inverseTransform(core::Matrix &data) const {
	ensureParams();
	if (static_cast<std::size_t>(data.cols()) != params_->center.size()) {
		throw std::invalid_argument("Matrix column count does not match the fitted scaler.");
	}
	for (Eigen::Index c = 0; c < data.cols(); ++c) {
		const auto idx = static_cast<std::size_t>(c);
		data.col(c) = (data.col(c).array() * params_->scale[idx] + params_->center[idx]).matrix();
	}
}

const ScaleParams &Scaler::params() const {
	ensureParams();
	return *params_;
}

const std::vector<std::size_t> &Scaler::degenerateFeatures() const {
	ensureParams();
	return params_->degenerate;
}

void Scaler::ensureParams() const {
	if (!params_.has_value()) {
		throw std::runtime_error("Scaler must be fitted before transform");
	}
}

// ============================================================================
// Variants
// ============================================================================

std::pair<double, double> IdentityScaler::columnParams(std::vector<double> &) const {
	return {0.0, 1.0};
}

std::pair<double, double> StandardScaler::columnParams(std::vector<double> &column) const {
	return {utils::Statistics::mean(column), utils::Statistics::stddev(column, 0)};
}

std::pair<double, double> RobustScaler::columnParams(std::vector<double> &column) const {
	const double median = utils::Statistics::median(column);
	const double q25 = utils::Statistics::quantile(column, 0.25);
	const double q75 = utils::Statistics::quantile(column, 0.75);
	return {median, q75 - q25};
}

std::pair<double, double> MinMaxScaler::columnParams(std::vector<double> &column) const {
	const auto [min_it, max_it] = std::minmax_element(column.begin(), column.end());
	return {*min_it, *max_it - *min_it};
}

std::unique_ptr<Scaler> makeScaler(ScalingMethod method) {
	switch (method) {
	case ScalingMethod::None:
		return std::make_unique<IdentityScaler>();
	case ScalingMethod::Standard:
		return std::make_unique<StandardScaler>();
	case ScalingMethod::Robust:
		return std::make_unique<RobustScaler>();
	case ScalingMethod::MinMax:
		return std::make_unique<MinMaxScaler>();
	}
	throw std::invalid_argument("Unsupported scaling method.");
}

} // namespace pricecast::transform
