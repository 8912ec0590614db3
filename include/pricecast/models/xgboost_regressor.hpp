#pragma once

#include "pricecast/core/dataset.hpp"

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

namespace pricecast::models {

class XgbBooster;

struct XGBoostConfig {
	std::size_t n_estimators = 100;
	double learning_rate = 0.3;  // eta
	int max_depth = 6;
	double reg_lambda = 1.0;     // L2 penalty on leaf weights
	double gamma = 0.0;          // minimum loss reduction to keep a split
	double min_child_weight = 1.0;
	double subsample = 1.0;
	unsigned int seed = 42;

	void validate() const;
};

/**
 * @class XGBoostRegressor
 * @brief Second-order boosting with L2-regularized leaf weights, via libxgboost.
 *
 * Uses the exact greedy tree method on one thread. Boosting starts from the
 * target mean, so a constant target is reproduced without any split.
 */
class XGBoostRegressor final {
public:
	explicit XGBoostRegressor(XGBoostConfig config = defaultConfig());

	static XGBoostConfig defaultConfig();

	void fit(const core::Matrix &features, const core::Vector &target);

	/// @throws std::runtime_error If called before fit.
	core::Vector predict(const core::Matrix &features) const;

	/// Total split gain per feature, normalized to sum to one.
	std::vector<double> featureImportances() const;

	std::string getName() const {
		return "XGBoost";
	}

	const XGBoostConfig &config() const noexcept {
		return config_;
	}

	double baseScore() const noexcept {
		return base_score_;
	}

private:
	XGBoostConfig config_;
	std::shared_ptr<XgbBooster> booster_;
	double base_score_ = 0.0;
	Eigen::Index n_features_ = 0;
};

} // namespace pricecast::models
