#pragma once

#include "pricecast/core/dataset.hpp"
#include "pricecast/models/lightgbm_model.hpp"

#include <string>
#include <vector>

namespace pricecast::models {

/**
 * @class GradientBoostingRegressor
 * @brief Least-squares gradient boosting with shallow trees.
 *
 * LightGBM "gbdt" starting from the target mean; each round fits a depth-3
 * tree to the residuals and adds it scaled by the learning rate.
 */
class GradientBoostingRegressor final {
public:
	explicit GradientBoostingRegressor(LightGbmConfig config = defaultConfig());

	static LightGbmConfig defaultConfig();

	void fit(const core::Matrix &features, const core::Vector &target) {
		model_.fit(features, target);
	}

	core::Vector predict(const core::Matrix &features) const {
		return model_.predict(features);
	}

	std::vector<double> featureImportances() const {
		return model_.featureImportances();
	}

	std::string getName() const {
		return "Gradient Boosting";
	}

	const LightGbmConfig &config() const noexcept {
		return model_.config();
	}

private:
	LightGbmModel model_;
};

} // namespace pricecast::models
