#include "pricecast/validation/walk_forward.hpp"
#include "pricecast/core/errors.hpp"
#include "pricecast/models/model_registry.hpp"
#include "pricecast/utils/logging.hpp"
#include "pricecast/utils/metrics.hpp"
#include "pricecast/utils/statistics.hpp"

#include <cmath>
#include <stdexcept>
#include <string>

namespace pricecast::validation {

namespace {

core::InsufficientHistoryError tooFewRows(std::size_t n_rows, std::size_t n_splits, const std::string &model_name) {
	return core::InsufficientHistoryError(std::to_string(n_rows) + " rows cannot form " + std::to_string(n_splits) +
	                                          " walk-forward folds; at least " + std::to_string(n_splits + 1) +
	                                          " are required.",
	                                      "evaluation", model_name);
}

FoldResult runFold(const core::Dataset &data, const FoldRange &range, std::size_t fold_id,
                   const std::string &model_name, const WalkForwardConfig &config) {
	auto train = data.slice(range.train_begin, range.train_end);
	auto test = data.slice(range.test_begin, range.test_end);

	auto scaler = transform::makeScaler(config.scaling);
	scaler->fit(train.features, data.feature_names);
	scaler->transform(train.features);
	scaler->transform(test.features);

	auto model = models::ModelRegistry::create(model_name, config.seed);
	model.fit(train.features, train.target);
	const core::Vector predicted = model.predict(test.features);
	if (!predicted.allFinite()) {
		throw core::PipelineError("Model produced non-finite predictions.", "evaluation", model_name, fold_id);
	}

	FoldResult fold;
	fold.fold_id = fold_id;
	fold.range = range;
	fold.predictions = core::toStdVector(predicted);
	fold.actuals = core::toStdVector(test.target);
	if (!utils::Metrics::r2(fold.actuals, fold.predictions)) {
		PRICECAST_WARN("Fold {} of '{}' has a constant target; R2 is undefined and scored by exact match.", fold_id,
		               model_name);
	}
	const auto metrics = utils::Metrics::score(fold.actuals, fold.predictions);
	fold.r2 = metrics.r2;
	fold.mae = metrics.mae;
	fold.rmse = metrics.rmse;
	for (auto index : scaler->degenerateFeatures()) {
		fold.degenerate_features.push_back(index < data.feature_names.size() ? data.feature_names[index]
		                                                                      : "#" + std::to_string(index));
	}
	return fold;
}

} // namespace

void WalkForwardConfig::validate() const {
	if (n_splits < 2) {
		throw std::invalid_argument("Walk-forward evaluation needs at least 2 splits.");
	}
}

std::vector<double> EvaluationReport::scores() const {
	std::vector<double> out;
	out.reserve(folds.size());
	for (const auto &fold : folds) {
		out.push_back(fold.r2);
	}
	return out;
}

void EvaluationReport::computeAggregatedMetrics() {
	if (folds.empty()) {
		return;
	}
	const auto r2 = scores();
	mean_r2 = utils::Statistics::mean(r2);
	std_r2 = utils::Statistics::stddev(r2, 0);

	double mae_sum = 0.0;
	double rmse_sum = 0.0;
	for (const auto &fold : folds) {
		mae_sum += fold.mae;
		rmse_sum += fold.rmse;
	}
	mean_mae = mae_sum / static_cast<double>(folds.size());
	mean_rmse = rmse_sum / static_cast<double>(folds.size());
}

WalkForwardEvaluator::WalkForwardEvaluator(WalkForwardConfig config) : config_(config) {
	config_.validate();
}

std::vector<FoldRange> WalkForwardEvaluator::generateFolds(std::size_t n_rows, std::size_t n_splits) {
	if (n_splits < 2) {
		throw std::invalid_argument("Walk-forward evaluation needs at least 2 splits.");
	}
	if (n_rows < n_splits + 1) {
		throw tooFewRows(n_rows, n_splits, {});
	}

	const std::size_t block = n_rows / (n_splits + 1);
	std::vector<FoldRange> folds;
	folds.reserve(n_splits);
	for (std::size_t i = 0; i < n_splits; ++i) {
		FoldRange range;
		range.train_begin = 0;
		range.train_end = n_rows - (n_splits - i) * block;
		range.test_begin = range.train_end;
		range.test_end = range.test_begin + block;
		folds.push_back(range);
	}
	return folds;
}

EvaluationReport WalkForwardEvaluator::evaluate(const core::Matrix &features, const core::Vector &target,
                                                const std::string &model_name) const {
	core::Dataset data;
	data.features = features;
	data.target = target;
	return evaluate(data, model_name);
}

EvaluationReport WalkForwardEvaluator::evaluate(const core::Dataset &data, const std::string &model_name) const {
	models::ModelRegistry::validate(model_name);
	data.validate();

	const std::size_t n_rows = data.rows();
	if (n_rows < config_.n_splits + 1) {
		throw tooFewRows(n_rows, config_.n_splits, model_name);
	}
	const auto ranges = generateFolds(n_rows, config_.n_splits);

	EvaluationReport report;
	report.model_name = model_name;
	report.folds.reserve(ranges.size());

	for (std::size_t i = 0; i < ranges.size(); ++i) {
		const auto &range = ranges[i];
		PRICECAST_DEBUG("Fold {}: train [{}, {}), test [{}, {}).", i, range.train_begin, range.train_end,
		                range.test_begin, range.test_end);
		try {
			report.folds.push_back(runFold(data, range, i, model_name, config_));
		} catch (const core::PipelineError &) {
			throw;
		} catch (const std::exception &e) {
			throw core::PipelineError(e.what(), "evaluation", model_name, i);
		}
	}

	report.computeAggregatedMetrics();
	PRICECAST_INFO("Walk-forward evaluation of '{}' over {} folds: mean R2 {:.4f} (std {:.4f}).", model_name,
	               report.folds.size(), report.mean_r2, report.std_r2);
	return report;
}

} // namespace pricecast::validation
