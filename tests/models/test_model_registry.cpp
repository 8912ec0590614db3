#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include "common/series_helpers.hpp"
#include "pricecast/core/errors.hpp"
#include "pricecast/models/model_registry.hpp"

#include <numeric>
#include <string>
#include <variant>
#include <vector>

using Catch::Approx;
using namespace pricecast;
using models::ModelRegistry;

TEST_CASE("Registry lists the six catalog models", "[models][registry]") {
	const std::vector<std::string> expected{"Linear Regression", "Random Forest", "Extra Trees",
	                                        "Gradient Boosting", "KNN",           "XGBoost"};
	REQUIRE(ModelRegistry::names() == expected);
	for (const auto &name : expected) {
		REQUIRE(ModelRegistry::contains(name));
	}
	REQUIRE_FALSE(ModelRegistry::contains("linear regression"));
}

TEST_CASE("Registry builds every model behind one interface", "[models][registry]") {
	const auto data = tests::helpers::makeLinearDataset(60);

	for (const auto &name : ModelRegistry::names()) {
		auto model = ModelRegistry::create(name);
		REQUIRE(model.getName() == name);

		model.fit(data.features, data.target);
		const auto predicted = model.predict(data.features);
		REQUIRE(predicted.size() == data.target.size());
		REQUIRE(predicted.allFinite());
	}
}

TEST_CASE("Only tree models expose feature importances", "[models][registry]") {
	const auto data = tests::helpers::makeLinearDataset(40);

	auto linear = ModelRegistry::create("Linear Regression");
	linear.fit(data.features, data.target);
	REQUIRE_FALSE(linear.hasFeatureImportances());
	REQUIRE_FALSE(linear.featureImportances().has_value());

	auto knn = ModelRegistry::create("KNN");
	knn.fit(data.features, data.target);
	REQUIRE_FALSE(knn.featureImportances().has_value());

	for (const auto *name : {"Random Forest", "Extra Trees", "Gradient Boosting", "XGBoost"}) {
		auto model = ModelRegistry::create(name);
		model.fit(data.features, data.target);
		REQUIRE(model.hasFeatureImportances());
		const auto importances = model.featureImportances();
		REQUIRE(importances.has_value());
		REQUIRE(importances->size() == 3);
		REQUIRE(std::accumulate(importances->begin(), importances->end(), 0.0) == Approx(1.0));
	}
}

TEST_CASE("Registry passes the seed to stochastic models", "[models][registry]") {
	auto model = ModelRegistry::create("Random Forest", 1234u);
	const auto &forest = std::get<models::RandomForestRegressor>(model.variant());
	REQUIRE(forest.config().seed == 1234u);
	REQUIRE(forest.config().n_estimators == 100);

	auto xgb = ModelRegistry::create("XGBoost");
	REQUIRE(std::get<models::XGBoostRegressor>(xgb.variant()).config().seed == ModelRegistry::kDefaultSeed);
}

TEST_CASE("Unknown model names raise UnknownModelError", "[models][registry][error]") {
	try {
		ModelRegistry::create("Unknown");
		FAIL("expected UnknownModelError");
	} catch (const core::UnknownModelError &e) {
		REQUIRE(e.stage() == "registry");
		REQUIRE(e.modelName() == "Unknown");
		REQUIRE(e.detail().find("Linear Regression") != std::string::npos);
	}
}
