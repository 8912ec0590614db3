#include "pricecast/models/lightgbm_model.hpp"
#include "pricecast/models/lightgbm_handles.hpp"
#include "pricecast/utils/logging.hpp"

#include <limits>
#include <numeric>
#include <stdexcept>
#include <utility>

namespace pricecast::models {

void LightGbmConfig::validate() const {
	if (boosting != "gbdt" && boosting != "rf") {
		throw std::invalid_argument("Unsupported LightGBM boosting type '" + boosting + "'.");
	}
	if (n_estimators == 0 || n_estimators > static_cast<std::size_t>(std::numeric_limits<int>::max())) {
		throw std::invalid_argument("A tree ensemble needs at least one tree.");
	}
	if (!(learning_rate > 0.0) || learning_rate > 1.0) {
		throw std::invalid_argument("Learning rate must be in (0, 1].");
	}
	if (num_leaves < 2) {
		throw std::invalid_argument("Trees need at least two leaves.");
	}
	if (min_data_in_leaf < 1) {
		throw std::invalid_argument("Leaves need at least one row.");
	}
	if (!(bagging_fraction > 0.0) || bagging_fraction > 1.0) {
		throw std::invalid_argument("Bagging fraction must be in (0, 1].");
	}
	if (!(feature_fraction > 0.0) || feature_fraction > 1.0) {
		throw std::invalid_argument("Feature fraction must be in (0, 1].");
	}
	if (lambda_l2 < 0.0) {
		throw std::invalid_argument("L2 regularization must be non-negative.");
	}
	// LightGBM's random forest mode refuses to train on identical copies of the data
	const bool bagged = bagging_freq > 0 && bagging_fraction < 1.0;
	if (boosting == "rf" && !bagged && !(feature_fraction < 1.0)) {
		throw std::invalid_argument("Random forest mode needs row bagging or a feature fraction below one.");
	}
}

std::string LightGbmConfig::parameterString() const {
	LightGbmParams params;
	params.set("objective", std::string("regression"))
	    .set("boosting", boosting)
	    .set("learning_rate", learning_rate)
	    .set("max_depth", max_depth)
	    .set("num_leaves", num_leaves)
	    .set("min_data_in_leaf", min_data_in_leaf)
	    .set("min_data_in_bin", 1)
	    .set("min_sum_hessian_in_leaf", 0.0)
	    .set("feature_pre_filter", std::string("false"))
	    .set("bagging_fraction", bagging_fraction)
	    .set("bagging_freq", bagging_freq)
	    .set("feature_fraction", feature_fraction)
	    .set("extra_trees", std::string(extra_trees ? "true" : "false"))
	    .set("lambda_l2", lambda_l2)
	    .set("seed", static_cast<int>(seed & 0x7fffffffu))
	    .set("num_threads", 1)
	    .set("deterministic", std::string("true"))
	    .set("force_row_wise", std::string("true"))
	    .set("verbosity", -1);
	return params.build();
}

LightGbmModel::LightGbmModel(LightGbmConfig config) : config_(std::move(config)) {
	config_.validate();
}

void LightGbmModel::fit(const core::Matrix &features, const core::Vector &target) {
	if (features.rows() == 0) {
		throw std::invalid_argument("Cannot fit a tree ensemble on zero rows.");
	}
	if (features.rows() != target.size()) {
		throw std::invalid_argument("Feature matrix and target vector must have the same number of rows.");
	}
	if (features.rows() > std::numeric_limits<int32_t>::max() || features.cols() > std::numeric_limits<int32_t>::max()) {
		throw std::invalid_argument("Feature matrix is too large for LightGBM.");
	}

	const auto nrow = static_cast<int32_t>(features.rows());
	const auto ncol = static_cast<int32_t>(features.cols());
	std::vector<float> labels(static_cast<std::size_t>(nrow));
	for (int32_t i = 0; i < nrow; ++i) {
		labels[static_cast<std::size_t>(i)] = static_cast<float>(target(i));
	}

	const auto params = config_.parameterString();
	LightGbmDataset dataset;
	dataset.create(features.data(), nrow, ncol, false, labels, params);

	auto booster = std::make_shared<LightGbmBooster>();
	booster->create(dataset, params);
	iterations_ = booster->train(static_cast<int>(config_.n_estimators));

	booster_ = std::move(booster);
	n_features_ = features.cols();
	PRICECAST_DEBUG("LightGBM {} ran {} of {} rounds on {} rows x {} features.", config_.boosting, iterations_,
	                config_.n_estimators, features.rows(), features.cols());
}

void LightGbmModel::ensureFitted() const {
	if (!booster_) {
		throw std::runtime_error("Predict called before fit.");
	}
}

core::Vector LightGbmModel::predict(const core::Matrix &features) const {
	ensureFitted();
	if (features.cols() != n_features_) {
		throw std::invalid_argument("Expected " + std::to_string(n_features_) + " features, got " +
		                            std::to_string(features.cols()) + ".");
	}
	if (features.rows() == 0) {
		return core::Vector(0);
	}
	const auto values = booster_->predict(features.data(), static_cast<int32_t>(features.rows()),
	                                      static_cast<int32_t>(features.cols()), false);
	if (static_cast<Eigen::Index>(values.size()) != features.rows()) {
		throw std::runtime_error("LightGBM returned " + std::to_string(values.size()) + " predictions for " +
		                         std::to_string(features.rows()) + " rows.");
	}
	return Eigen::Map<const core::Vector>(values.data(), features.rows());
}

std::vector<double> LightGbmModel::featureImportances() const {
	if (!booster_) {
		throw std::runtime_error("Feature importances requested before fit.");
	}
	return normalizeGains(booster_->gainImportance(static_cast<int32_t>(n_features_)));
}

std::vector<double> normalizeGains(const std::vector<double> &gains) {
	const double total = std::accumulate(gains.begin(), gains.end(), 0.0);
	std::vector<double> out(gains.size(), 0.0);
	if (total > 0.0) {
		for (std::size_t i = 0; i < gains.size(); ++i) {
			out[i] = gains[i] / total;
		}
	}
	return out;
}

} // namespace pricecast::models
