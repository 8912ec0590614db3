#include "pricecast/models/gradient_boosting.hpp"

#include <utility>

namespace pricecast::models {

GradientBoostingRegressor::GradientBoostingRegressor(LightGbmConfig config) : model_(std::move(config)) {
}

LightGbmConfig GradientBoostingRegressor::defaultConfig() {
	LightGbmConfig config;
	config.boosting = "gbdt";
	config.n_estimators = 100;
	config.learning_rate = 0.1;
	config.max_depth = 3;
	config.num_leaves = 8;
	config.min_data_in_leaf = 1;
	return config;
}

} // namespace pricecast::models
