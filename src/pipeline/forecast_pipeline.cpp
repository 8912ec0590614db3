#include "pricecast/pipeline/forecast_pipeline.hpp"
#include "pricecast/core/errors.hpp"
#include "pricecast/models/model_registry.hpp"
#include "pricecast/utils/logging.hpp"

#include <algorithm>
#include <stdexcept>
#include <utility>

namespace pricecast::pipeline {

void PipelineConfig::validate() const {
	if (horizon <= 0) {
		throw std::invalid_argument("Forecast horizon must be positive.");
	}
	if (n_splits < 2) {
		throw std::invalid_argument("Walk-forward evaluation needs at least 2 splits.");
	}
	if (test_fraction && !(*test_fraction > 0.0 && *test_fraction < 1.0)) {
		throw std::invalid_argument("Test fraction must be in (0, 1).");
	}
	features.validate();
	models::ModelRegistry::validate(model_name);
}

StageError describeFailure(const std::exception &error, const std::string &stage, const std::string &model_name) {
	StageError out;
	out.message = error.what();
	if (const auto *pipeline_error = dynamic_cast<const core::PipelineError *>(&error)) {
		out.detail = pipeline_error->detail();
		out.stage = pipeline_error->stage();
		out.model_name = pipeline_error->modelName();
		out.fold_index = pipeline_error->foldIndex();
	} else {
		out.detail = out.message;
		out.stage = stage;
		out.model_name = model_name;
	}
	return out;
}

std::string toString(PipelineStage stage) {
	switch (stage) {
	case PipelineStage::Idle:
		return "Idle";
	case PipelineStage::FeaturesBuilt:
		return "FeaturesBuilt";
	case PipelineStage::Evaluated:
		return "Evaluated";
	case PipelineStage::EvaluationFailed:
		return "EvaluationFailed";
	case PipelineStage::Forecasted:
		return "Forecasted";
	case PipelineStage::ForecastFailed:
		return "ForecastFailed";
	}
	return "?";
}

ForecastPipeline::ForecastPipeline(PipelineConfig config) : config_(std::move(config)) {
	config_.validate();
}

void ForecastPipeline::transition(PipelineResult &result, PipelineStage next) {
	PRICECAST_DEBUG("Pipeline: {} -> {}", toString(stage_), toString(next));
	stage_ = next;
	result.trace.push_back(next);
}

PipelineResult ForecastPipeline::run(const core::PriceSeries &series, const features::IndicatorColumns &indicators) {
	PipelineResult result;
	result.trace.push_back(PipelineStage::Idle);

	// Enough rows for every walk-forward fold to have a train and a test row
	auto feature_config = config_.features;
	feature_config.min_rows = std::max(feature_config.min_rows, config_.n_splits + 1);

	const auto feature_set = features::FeatureBuilder(feature_config).build(series, config_.horizon, indicators);
	result.feature_rows = feature_set.training.rows();
	result.feature_names = feature_set.training.feature_names;
	transition(result, PipelineStage::FeaturesBuilt);

	validation::WalkForwardConfig wf_config;
	wf_config.n_splits = config_.n_splits;
	wf_config.scaling = config_.scaling;
	wf_config.seed = config_.seed;
	try {
		result.evaluation = validation::WalkForwardEvaluator(wf_config).evaluate(feature_set.training,
		                                                                         config_.model_name);
		transition(result, PipelineStage::Evaluated);
	} catch (const std::exception &e) {
		PRICECAST_ERROR("Evaluation failed: {}", e.what());
		result.evaluation_error = describeFailure(e, "evaluation", config_.model_name);
		transition(result, PipelineStage::EvaluationFailed);
	}

	if (config_.test_fraction) {
		validation::HoldoutConfig holdout_config;
		holdout_config.test_fraction = *config_.test_fraction;
		holdout_config.scaling = config_.scaling;
		holdout_config.seed = config_.seed;
		try {
			result.holdout = validation::HoldoutEvaluator(holdout_config).evaluate(feature_set.training,
			                                                                       config_.model_name);
		} catch (const std::exception &e) {
			PRICECAST_ERROR("Holdout evaluation failed: {}", e.what());
			result.holdout_error = describeFailure(e, "holdout", config_.model_name);
		}
	}

	forecast::ForecastConfig forecast_config;
	forecast_config.scaling = config_.scaling;
	forecast_config.seed = config_.seed;
	try {
		result.forecast = forecast::Forecaster(forecast_config).forecast(feature_set, config_.model_name);
		transition(result, PipelineStage::Forecasted);
	} catch (const std::exception &e) {
		PRICECAST_ERROR("Forecast failed: {}", e.what());
		result.forecast_error = describeFailure(e, "forecast", config_.model_name);
		transition(result, PipelineStage::ForecastFailed);
	}

	transition(result, PipelineStage::Idle);
	return result;
}

} // namespace pricecast::pipeline
