#pragma once

#include "pricecast/models/regressor.hpp"

#include <string>
#include <vector>

namespace pricecast::models {

/**
 * @class ModelRegistry
 * @brief The fixed catalog of regressors, addressed by display name.
 *
 * Keys: "Linear Regression", "Random Forest", "Extra Trees",
 * "Gradient Boosting", "KNN" and "XGBoost". Stochastic models are built with
 * the given seed so repeated runs are reproducible.
 */
class ModelRegistry {
public:
	static constexpr unsigned int kDefaultSeed = 42;

	/**
	 * @brief Constructs a fresh, unfitted model.
	 * @throws core::UnknownModelError If @p name is not a registry key.
	 */
	static Regressor create(const std::string &name, unsigned int seed = kDefaultSeed);

	static bool contains(const std::string &name);

	/// Registry keys in catalog order.
	static std::vector<std::string> names();

	/// @throws core::UnknownModelError If @p name is not a registry key.
	static void validate(const std::string &name);
};

} // namespace pricecast::models
