#pragma once

#include "pricecast/core/dataset.hpp"

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

namespace pricecast::models {

class LightGbmBooster;

/**
 * @brief Training parameters passed to LightGBM.
 *
 * Runs are single-threaded with deterministic histogram construction, so a
 * fitted model depends only on the data and @c seed.
 */
struct LightGbmConfig {
	std::string boosting = "gbdt";     // "gbdt" or "rf"
	std::size_t n_estimators = 100;
	double learning_rate = 0.1;        // ignored by "rf"
	int max_depth = -1;                // -1 = unlimited
	int num_leaves = 31;
	int min_data_in_leaf = 1;
	double bagging_fraction = 1.0;     // rows drawn without replacement per tree
	int bagging_freq = 0;
	double feature_fraction = 1.0;     // features drawn per tree
	bool extra_trees = false;          // one random threshold per feature
	double lambda_l2 = 0.0;
	unsigned int seed = 42;

	/// @throws std::invalid_argument For out-of-range fractions or counts.
	void validate() const;

	std::string parameterString() const;
};

/**
 * @class LightGbmModel
 * @brief Squared-error regression through the LightGBM C API.
 *
 * The fitted booster is shared between copies; fit() replaces it rather than
 * mutating it.
 */
class LightGbmModel {
public:
	explicit LightGbmModel(LightGbmConfig config);

	/// @throws std::invalid_argument On empty input or mismatched shapes.
	void fit(const core::Matrix &features, const core::Vector &target);

	/// @throws std::runtime_error If called before fit.
	core::Vector predict(const core::Matrix &features) const;

	/// Total split gain per feature, normalized to sum to one.
	std::vector<double> featureImportances() const;

	const LightGbmConfig &config() const noexcept {
		return config_;
	}

	/// Boosting rounds actually run; LightGBM stops early when no split has positive gain.
	int iterations() const noexcept {
		return iterations_;
	}

private:
	void ensureFitted() const;

	LightGbmConfig config_;
	std::shared_ptr<LightGbmBooster> booster_;
	Eigen::Index n_features_ = 0;
	int iterations_ = 0;
};

/// Scales non-negative gains to sum to one; all zeros when nothing was split.
std::vector<double> normalizeGains(const std::vector<double> &gains);

} // namespace pricecast::models
