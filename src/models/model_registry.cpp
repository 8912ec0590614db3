#include "pricecast/models/model_registry.hpp"
#include "pricecast/core/errors.hpp"

#include <algorithm>

namespace pricecast::models {

std::vector<std::string> ModelRegistry::names() {
	return {"Linear Regression", "Random Forest", "Extra Trees", "Gradient Boosting", "KNN", "XGBoost"};
}

bool ModelRegistry::contains(const std::string &name) {
	const auto keys = names();
	return std::find(keys.begin(), keys.end(), name) != keys.end();
}

void ModelRegistry::validate(const std::string &name) {
	if (!contains(name)) {
		std::string known;
		for (const auto &key : names()) {
			known += known.empty() ? key : ", " + key;
		}
		throw core::UnknownModelError("Unknown model '" + name + "'. Available: " + known + ".", "registry", name);
	}
}

Regressor ModelRegistry::create(const std::string &name, unsigned int seed) {
	validate(name);

	if (name == "Linear Regression") {
		return Regressor(LinearRegression());
	}
	if (name == "Random Forest") {
		auto config = RandomForestRegressor::defaultConfig();
		config.seed = seed;
		return Regressor(RandomForestRegressor(config));
	}
	if (name == "Extra Trees") {
		auto config = ExtraTreesRegressor::defaultConfig();
		config.seed = seed;
		return Regressor(ExtraTreesRegressor(config));
	}
	if (name == "Gradient Boosting") {
		auto config = GradientBoostingRegressor::defaultConfig();
		config.seed = seed;
		return Regressor(GradientBoostingRegressor(config));
	}
	if (name == "KNN") {
		return Regressor(KNeighborsRegressor());
	}
	auto config = XGBoostRegressor::defaultConfig();
	config.seed = seed;
	return Regressor(XGBoostRegressor(config));
}

} // namespace pricecast::models
