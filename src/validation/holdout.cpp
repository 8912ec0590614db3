#include "pricecast/validation/holdout.hpp"
#include "pricecast/core/errors.hpp"
#include "pricecast/models/model_registry.hpp"
#include "pricecast/utils/logging.hpp"
#include "pricecast/utils/metrics.hpp"

#include <algorithm>
#include <cmath>
#include <numeric>
#include <random>
#include <stdexcept>
#include <string>

namespace pricecast::validation {

void HoldoutConfig::validate() const {
	if (!(test_fraction > 0.0 && test_fraction < 1.0)) {
		throw std::invalid_argument("Test fraction must be in (0, 1).");
	}
}

HoldoutEvaluator::HoldoutEvaluator(HoldoutConfig config) : config_(config) {
	config_.validate();
}

HoldoutSplit HoldoutEvaluator::split(std::size_t n_rows, double test_fraction, unsigned int seed) {
	if (n_rows < 2) {
		throw core::InsufficientHistoryError("A holdout split needs at least 2 rows, got " + std::to_string(n_rows) +
		                                         ".",
		                                     "holdout");
	}
	if (!(test_fraction > 0.0 && test_fraction < 1.0)) {
		throw std::invalid_argument("Test fraction must be in (0, 1).");
	}

	std::vector<std::size_t> order(n_rows);
	std::iota(order.begin(), order.end(), 0);
	std::mt19937 rng(seed);
	std::shuffle(order.begin(), order.end(), rng);

	auto test_size = static_cast<std::size_t>(std::lround(test_fraction * static_cast<double>(n_rows)));
	test_size = std::clamp<std::size_t>(test_size, 1, n_rows - 1);

	HoldoutSplit result;
	result.test.assign(order.begin(), order.begin() + static_cast<std::ptrdiff_t>(test_size));
	result.train.assign(order.begin() + static_cast<std::ptrdiff_t>(test_size), order.end());
	std::sort(result.test.begin(), result.test.end());
	std::sort(result.train.begin(), result.train.end());
	return result;
}

HoldoutReport HoldoutEvaluator::evaluate(const core::Dataset &data, const std::string &model_name) const {
	models::ModelRegistry::validate(model_name);
	data.validate();

	const auto indices = split(data.rows(), config_.test_fraction, config_.seed);
	HoldoutReport report;
	report.model_name = model_name;
	report.train_rows = indices.train.size();
	report.test_rows = indices.test.size();

	try {
		auto train = data.select(indices.train);
		auto test = data.select(indices.test);

		auto scaler = transform::makeScaler(config_.scaling);
		scaler->fit(train.features, data.feature_names);
		scaler->transform(train.features);
		scaler->transform(test.features);

		auto model = models::ModelRegistry::create(model_name, config_.seed);
		model.fit(train.features, train.target);
		const core::Vector predicted = model.predict(test.features);
		if (!predicted.allFinite()) {
			throw core::PipelineError("Model produced non-finite predictions.", "holdout", model_name);
		}

		const auto metrics = utils::Metrics::score(core::toStdVector(test.target), core::toStdVector(predicted));
		report.r2 = metrics.r2;
		report.mae = metrics.mae;
		report.rmse = metrics.rmse;
	} catch (const core::PipelineError &) {
		throw;
	} catch (const std::exception &e) {
		throw core::PipelineError(e.what(), "holdout", model_name);
	}

	PRICECAST_INFO("Holdout evaluation of '{}' ({} train / {} test rows): R2 {:.4f}, MAE {:.4f}.", model_name,
	               report.train_rows, report.test_rows, report.r2, report.mae);
	return report;
}

} // namespace pricecast::validation
