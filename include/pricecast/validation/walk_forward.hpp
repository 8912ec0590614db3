#pragma once

#include "pricecast/core/dataset.hpp"
#include "pricecast/transform/scaler.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace pricecast::validation {

/**
 * @brief Configuration for expanding-window evaluation
 */
struct WalkForwardConfig {
	std::size_t n_splits = 5;
	transform::ScalingMethod scaling = transform::ScalingMethod::Standard;
	unsigned int seed = 42;  // passed to stochastic models

	/// @throws std::invalid_argument If n_splits < 2.
	void validate() const;
};

/**
 * @brief Row ranges of one fold, half-open.
 */
struct FoldRange {
	std::size_t train_begin = 0;
	std::size_t train_end = 0;
	std::size_t test_begin = 0;
	std::size_t test_end = 0;
};

/**
 * @brief Results from a single walk-forward fold
 */
struct FoldResult {
	std::size_t fold_id = 0;
	FoldRange range;

	std::vector<double> predictions;
	std::vector<double> actuals;

	double r2 = 0.0;
	double mae = 0.0;
	double rmse = 0.0;

	// Features the fold's scaler left unscaled (zero spread on the training rows)
	std::vector<std::string> degenerate_features;
};

struct EvaluationReport {
	std::string model_name;
	std::vector<FoldResult> folds;

	double mean_r2 = 0.0;
	double std_r2 = 0.0;  // population standard deviation across folds
	double mean_mae = 0.0;
	double mean_rmse = 0.0;

	/// Per-fold R² in fold order.
	std::vector<double> scores() const;

	void computeAggregatedMetrics();
};

/**
 * @class WalkForwardEvaluator
 * @brief Expanding-window cross-validation of a registry model.
 *
 * With n rows and k splits the test block size is n / (k + 1); fold i trains
 * on [0, n - (k - i) * block) and tests on the block that follows. Each fold
 * fits its own scaler on its training rows and builds a fresh model.
 */
class WalkForwardEvaluator {
public:
	explicit WalkForwardEvaluator(WalkForwardConfig config = {});

	/**
	 * @throws core::UnknownModelError If @p model_name is not a registry key.
	 * @throws core::InsufficientHistoryError If the dataset has fewer than n_splits + 1 rows.
	 * @throws core::PipelineError If fitting or predicting fails inside a fold.
	 */
	EvaluationReport evaluate(const core::Dataset &data, const std::string &model_name) const;

	EvaluationReport evaluate(const core::Matrix &features, const core::Vector &target,
	                          const std::string &model_name) const;

	/**
	 * @brief Generate fold ranges
	 * @throws std::invalid_argument If n_splits < 2.
	 * @throws core::InsufficientHistoryError If n_rows < n_splits + 1.
	 */
	static std::vector<FoldRange> generateFolds(std::size_t n_rows, std::size_t n_splits);

	const WalkForwardConfig &config() const noexcept {
		return config_;
	}

private:
	WalkForwardConfig config_;
};

} // namespace pricecast::validation
