#include "pricecast/models/xgboost_regressor.hpp"
#include "pricecast/models/lightgbm_model.hpp"
#include "pricecast/models/xgboost_handles.hpp"
#include "pricecast/utils/logging.hpp"

#include <limits>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace pricecast::models {

namespace {

using RowMajorFloat = Eigen::Matrix<float, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;

XgbDMatrix toDMatrix(const core::Matrix &features) {
	const RowMajorFloat values = features.cast<float>();
	XgbDMatrix matrix;
	matrix.create(values.data(), static_cast<std::size_t>(values.rows()), static_cast<std::size_t>(values.cols()));
	return matrix;
}

std::string formatParam(double value) {
	std::ostringstream out;
	out.precision(17);
	out << value;
	return out.str();
}

} // namespace

void XGBoostConfig::validate() const {
	if (n_estimators == 0 || n_estimators > static_cast<std::size_t>(std::numeric_limits<int>::max())) {
		throw std::invalid_argument("Boosting needs at least one round.");
	}
	if (!(learning_rate > 0.0) || learning_rate > 1.0) {
		throw std::invalid_argument("Learning rate must be in (0, 1].");
	}
	if (max_depth < 1) {
		throw std::invalid_argument("Tree depth must be at least 1.");
	}
	if (reg_lambda < 0.0 || gamma < 0.0 || min_child_weight < 0.0) {
		throw std::invalid_argument("Regularization terms must be non-negative.");
	}
	if (!(subsample > 0.0) || subsample > 1.0) {
		throw std::invalid_argument("Subsample fraction must be in (0, 1].");
	}
}

XGBoostRegressor::XGBoostRegressor(XGBoostConfig config) : config_(config) {
	config_.validate();
}

XGBoostConfig XGBoostRegressor::defaultConfig() {
	return XGBoostConfig{};
}

void XGBoostRegressor::fit(const core::Matrix &features, const core::Vector &target) {
	if (features.rows() == 0) {
		throw std::invalid_argument("Cannot fit boosted trees on zero rows.");
	}
	if (features.rows() != target.size()) {
		throw std::invalid_argument("Feature matrix and target vector must have the same number of rows.");
	}

	auto train = toDMatrix(features);
	std::vector<float> labels(static_cast<std::size_t>(target.size()));
	for (Eigen::Index i = 0; i < target.size(); ++i) {
		labels[static_cast<std::size_t>(i)] = static_cast<float>(target(i));
	}
	train.setLabels(labels);

	const double base_score = target.mean();
	auto booster = std::make_shared<XgbBooster>();
	booster->create(train);
	booster->setParam("objective", "reg:squarederror");
	booster->setParam("tree_method", "exact");
	booster->setParam("nthread", "1");
	booster->setParam("verbosity", "0");
	booster->setParam("seed", std::to_string(config_.seed));
	booster->setParam("eta", formatParam(config_.learning_rate));
	booster->setParam("max_depth", std::to_string(config_.max_depth));
	booster->setParam("lambda", formatParam(config_.reg_lambda));
	booster->setParam("gamma", formatParam(config_.gamma));
	booster->setParam("min_child_weight", formatParam(config_.min_child_weight));
	booster->setParam("subsample", formatParam(config_.subsample));
	booster->setParam("base_score", formatParam(base_score));

	for (std::size_t round = 0; round < config_.n_estimators; ++round) {
		booster->updateOneIter(static_cast<int>(round), train);
	}

	booster_ = std::move(booster);
	base_score_ = base_score;
	n_features_ = features.cols();
	PRICECAST_DEBUG("Fitted {} XGBoost rounds on {} rows x {} features (base score {:.4f}).", config_.n_estimators,
	                features.rows(), features.cols(), base_score_);
}

core::Vector XGBoostRegressor::predict(const core::Matrix &features) const {
	if (!booster_) {
		throw std::runtime_error("Predict called before fit.");
	}
	if (features.cols() != n_features_) {
		throw std::invalid_argument("Expected " + std::to_string(n_features_) + " features, got " +
		                            std::to_string(features.cols()) + ".");
	}
	if (features.rows() == 0) {
		return core::Vector(0);
	}
	const auto values = booster_->predict(toDMatrix(features));
	if (static_cast<Eigen::Index>(values.size()) != features.rows()) {
		throw std::runtime_error("XGBoost returned " + std::to_string(values.size()) + " predictions for " +
		                         std::to_string(features.rows()) + " rows.");
	}
	return Eigen::Map<const Eigen::VectorXf>(values.data(), features.rows()).cast<double>();
}

std::vector<double> XGBoostRegressor::featureImportances() const {
	if (!booster_) {
		throw std::runtime_error("Feature importances requested before fit.");
	}
	return normalizeGains(booster_->totalGain(static_cast<std::size_t>(n_features_)));
}

} // namespace pricecast::models
