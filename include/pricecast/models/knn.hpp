#pragma once

#include "pricecast/core/dataset.hpp"

#include <mlpack/core.hpp>
#include <mlpack/methods/neighbor_search/neighbor_search.hpp>

#include <cstddef>
#include <string>

namespace pricecast::models {

enum class NeighborWeighting { Uniform, Distance };

struct KNeighborsConfig {
	std::size_t n_neighbors = 5;
	NeighborWeighting weighting = NeighborWeighting::Uniform;
};

/**
 * @class KNeighborsRegressor
 * @brief Averages the targets of the nearest training rows in Euclidean distance.
 *
 * Neighbours come from an exhaustive mlpack::KNN search over the training
 * rows in order; a row only displaces a current neighbour when it is strictly
 * closer, so equidistant rows are ranked by their training index. Fewer
 * training rows than n_neighbors shrink the neighbourhood to the whole
 * training set.
 */
class KNeighborsRegressor final {
public:
	explicit KNeighborsRegressor(KNeighborsConfig config = {});

	void fit(const core::Matrix &features, const core::Vector &target);
	core::Vector predict(const core::Matrix &features) const;

	std::string getName() const {
		return "KNN";
	}

	const KNeighborsConfig &config() const noexcept {
		return config_;
	}

private:
	KNeighborsConfig config_;
	// Search() is non-const in mlpack
	mutable mlpack::KNN searcher_ {mlpack::NAIVE_MODE};
	core::Vector train_target_;
	Eigen::Index n_features_ = 0;
	bool is_fitted_ = false;
};

} // namespace pricecast::models
