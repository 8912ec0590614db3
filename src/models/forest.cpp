#include "pricecast/models/forest.hpp"

#include <utility>

namespace pricecast::models {

namespace {

LightGbmConfig deepAveragedTrees() {
	LightGbmConfig config;
	config.boosting = "rf";
	config.n_estimators = 100;
	config.max_depth = -1;
	config.num_leaves = 255;
	config.min_data_in_leaf = 1;
	return config;
}

} // namespace

RandomForestRegressor::RandomForestRegressor(LightGbmConfig config) : model_(std::move(config)) {
}

LightGbmConfig RandomForestRegressor::defaultConfig() {
	auto config = deepAveragedTrees();
	config.bagging_fraction = 0.632;
	config.bagging_freq = 1;
	return config;
}

ExtraTreesRegressor::ExtraTreesRegressor(LightGbmConfig config) : model_(std::move(config)) {
}

LightGbmConfig ExtraTreesRegressor::defaultConfig() {
	auto config = deepAveragedTrees();
	config.extra_trees = true;
	// "rf" mode needs some per-tree sampling; this still keeps every column below 500 features
	config.feature_fraction = 0.999;
	return config;
}

} // namespace pricecast::models
