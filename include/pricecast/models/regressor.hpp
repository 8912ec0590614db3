#pragma once

#include "pricecast/core/dataset.hpp"
#include "pricecast/models/forest.hpp"
#include "pricecast/models/gradient_boosting.hpp"
#include "pricecast/models/knn.hpp"
#include "pricecast/models/linear_regression.hpp"
#include "pricecast/models/xgboost_regressor.hpp"

#include <optional>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace pricecast::models {

using RegressorVariant = std::variant<LinearRegression, RandomForestRegressor, ExtraTreesRegressor,
                                      GradientBoostingRegressor, KNeighborsRegressor, XGBoostRegressor>;

template <typename Model, typename = void>
struct HasFeatureImportances : std::false_type {};

template <typename Model>
struct HasFeatureImportances<Model, std::void_t<decltype(std::declval<const Model &>().featureImportances())>>
    : std::true_type {};

/**
 * @class Regressor
 * @brief One estimator from the fixed catalog, dispatched through std::visit.
 *
 * Every alternative provides fit, predict and getName; tree ensembles also
 * provide featureImportances, which is surfaced as an optional here.
 */
class Regressor {
public:
	template <typename Model, typename = std::enable_if_t<!std::is_same_v<std::decay_t<Model>, Regressor>>>
	explicit Regressor(Model &&model) : model_(std::forward<Model>(model)) {
	}

	void fit(const core::Matrix &features, const core::Vector &target) {
		std::visit([&](auto &model) { model.fit(features, target); }, model_);
	}

	core::Vector predict(const core::Matrix &features) const {
		return std::visit([&](const auto &model) { return model.predict(features); }, model_);
	}

	std::string getName() const {
		return std::visit([](const auto &model) { return model.getName(); }, model_);
	}

	bool hasFeatureImportances() const noexcept {
		return std::visit(
		    [](const auto &model) { return HasFeatureImportances<std::decay_t<decltype(model)>>::value; }, model_);
	}

	/// Normalized importances in feature order; nullopt for models that do not expose them.
	std::optional<std::vector<double>> featureImportances() const {
		return std::visit(
		    [](const auto &model) -> std::optional<std::vector<double>> {
			    if constexpr (HasFeatureImportances<std::decay_t<decltype(model)>>::value) {
				    return model.featureImportances();
			    } else {
				    return std::nullopt;
			    }
		    },
		    model_);
	}

	const RegressorVariant &variant() const noexcept {
		return model_;
	}

private:
	RegressorVariant model_;
};

} // namespace pricecast::models
