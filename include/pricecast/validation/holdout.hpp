#pragma once

#include "pricecast/core/dataset.hpp"
#include "pricecast/transform/scaler.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace pricecast::validation {

struct HoldoutConfig {
	double test_fraction = 0.2;
	transform::ScalingMethod scaling = transform::ScalingMethod::Standard;
	unsigned int seed = 42;

	/// @throws std::invalid_argument If test_fraction is outside (0, 1).
	void validate() const;
};

struct HoldoutSplit {
	std::vector<std::size_t> train;
	std::vector<std::size_t> test;
};

struct HoldoutReport {
	std::string model_name;
	std::size_t train_rows = 0;
	std::size_t test_rows = 0;
	double r2 = 0.0;
	double mae = 0.0;
	double rmse = 0.0;
};

/**
 * @class HoldoutEvaluator
 * @brief Single shuffled train/test split, the non-temporal alternative to walk-forward.
 *
 * Rows are permuted with a seeded generator; the first round(test_fraction * n)
 * of the permutation form the test set. The scaler is fitted on the training
 * rows only.
 */
class HoldoutEvaluator {
public:
	explicit HoldoutEvaluator(HoldoutConfig config = {});

	/**
	 * @throws core::UnknownModelError If @p model_name is not a registry key.
	 * @throws core::InsufficientHistoryError If the dataset has fewer than two rows.
	 */
	HoldoutReport evaluate(const core::Dataset &data, const std::string &model_name) const;

	/// Row indices of both sides, each in ascending order.
	static HoldoutSplit split(std::size_t n_rows, double test_fraction, unsigned int seed);

	const HoldoutConfig &config() const noexcept {
		return config_;
	}

private:
	HoldoutConfig config_;
};

} // namespace pricecast::validation
