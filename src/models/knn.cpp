#include "pricecast/models/knn.hpp"
#include "pricecast/utils/logging.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>

namespace pricecast::models {

namespace {

// mlpack stores one observation per column
arma::mat toColumns(const core::Matrix &features) {
	const arma::mat rows(const_cast<double *>(features.data()), static_cast<arma::uword>(features.rows()),
	                     static_cast<arma::uword>(features.cols()), false, true);
	return rows.t();
}

} // namespace

KNeighborsRegressor::KNeighborsRegressor(KNeighborsConfig config) : config_(config) {
	if (config_.n_neighbors == 0) {
		throw std::invalid_argument("n_neighbors must be positive.");
	}
}

void KNeighborsRegressor::fit(const core::Matrix &features, const core::Vector &target) {
	if (features.rows() == 0) {
		throw std::invalid_argument("Cannot fit KNN on zero rows.");
	}
	if (features.rows() != target.size()) {
		throw std::invalid_argument("Feature matrix and target vector must have the same number of rows.");
	}
	searcher_.Train(toColumns(features));
	train_target_ = target;
	n_features_ = features.cols();
	is_fitted_ = true;
	if (static_cast<std::size_t>(features.rows()) < config_.n_neighbors) {
		PRICECAST_DEBUG("KNN fitted on {} rows; neighbourhood shrinks from {}.", features.rows(),
		                config_.n_neighbors);
	}
}

core::Vector KNeighborsRegressor::predict(const core::Matrix &features) const {
	if (!is_fitted_) {
		throw std::runtime_error("Predict called before fit.");
	}
	if (features.cols() != n_features_) {
		throw std::invalid_argument("Expected " + std::to_string(n_features_) + " features, got " +
		                            std::to_string(features.cols()) + ".");
	}
	if (features.rows() == 0) {
		return core::Vector(0);
	}

	const auto n_train = static_cast<std::size_t>(train_target_.size());
	const std::size_t k = std::min(config_.n_neighbors, n_train);
	arma::Mat<std::size_t> neighbors;
	arma::mat distances;
	searcher_.Search(toColumns(features), k, neighbors, distances);

	core::Vector out(features.rows());
	for (Eigen::Index r = 0; r < features.rows(); ++r) {
		const auto query = static_cast<arma::uword>(r);
		if (config_.weighting == NeighborWeighting::Uniform) {
			double sum = 0.0;
			for (std::size_t j = 0; j < k; ++j) {
				sum += train_target_(static_cast<Eigen::Index>(neighbors(j, query)));
			}
			out(r) = sum / static_cast<double>(k);
			continue;
		}

		// Exact matches take all the weight
		double exact_sum = 0.0;
		std::size_t exact_count = 0;
		double weighted_sum = 0.0;
		double weight_total = 0.0;
		for (std::size_t j = 0; j < k; ++j) {
			const double target = train_target_(static_cast<Eigen::Index>(neighbors(j, query)));
			const double distance = distances(j, query);
			if (distance == 0.0) {
				exact_sum += target;
				++exact_count;
			} else {
				weighted_sum += target / distance;
				weight_total += 1.0 / distance;
			}
		}
		out(r) = exact_count > 0 ? exact_sum / static_cast<double>(exact_count) : weighted_sum / weight_total;
	}
	return out;
}

} // namespace pricecast::models
