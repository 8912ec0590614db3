#pragma once

#include "pricecast/core/dataset.hpp"
#include "pricecast/models/lightgbm_model.hpp"

#include <string>
#include <vector>

namespace pricecast::models {

/**
 * @class RandomForestRegressor
 * @brief Averaged deep trees, each grown on a bagged sample of the rows.
 *
 * Runs LightGBM in "rf" mode. Each tree sees 63.2% of the rows drawn without
 * replacement, the expected share of distinct rows in a bootstrap sample.
 */
class RandomForestRegressor final {
public:
	explicit RandomForestRegressor(LightGbmConfig config = defaultConfig());

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
		return "Random Forest";
	}

	const LightGbmConfig &config() const noexcept {
		return model_.config();
	}

private:
	LightGbmModel model_;
};

/**
 * @class ExtraTreesRegressor
 * @brief Extremely randomized trees: one random threshold per candidate feature, no row bagging.
 */
class ExtraTreesRegressor final {
public:
	explicit ExtraTreesRegressor(LightGbmConfig config = defaultConfig());

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
		return "Extra Trees";
	}

	const LightGbmConfig &config() const noexcept {
		return model_.config();
	}

private:
	LightGbmModel model_;
};

} // namespace pricecast::models
