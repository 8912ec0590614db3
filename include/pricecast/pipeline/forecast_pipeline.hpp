#pragma once

#include "pricecast/core/price_series.hpp"
#include "pricecast/features/feature_builder.hpp"
#include "pricecast/forecast/forecaster.hpp"
#include "pricecast/transform/scaler.hpp"
#include "pricecast/validation/holdout.hpp"
#include "pricecast/validation/walk_forward.hpp"

#include <cstddef>
#include <exception>
#include <optional>
#include <string>
#include <vector>

namespace pricecast::pipeline {

struct PipelineConfig {
	int horizon = 5;
	std::size_t n_splits = 5;
	std::string model_name = "Linear Regression";
	transform::ScalingMethod scaling = transform::ScalingMethod::Standard;
	unsigned int seed = 42;

	// When set, a shuffled holdout evaluation is reported alongside walk-forward
	std::optional<double> test_fraction;

	features::FeatureConfig features{};

	/**
	 * @throws std::invalid_argument For a non-positive horizon, fewer than 2 splits or a bad test fraction.
	 * @throws core::UnknownModelError If model_name is not a registry key.
	 */
	void validate() const;
};

/**
 * @brief A stage failure recorded in a PipelineResult.
 *
 * Keeps the context a core::PipelineError carries. Failures raised as other
 * exceptions get the stage and model the pipeline was running.
 */
struct StageError {
	std::string message;  // full what() text
	std::string detail;   // message without the context prefix
	std::string stage;
	std::string model_name;
	std::optional<std::size_t> fold_index;
};

StageError describeFailure(const std::exception &error, const std::string &stage, const std::string &model_name);

enum class PipelineStage { Idle, FeaturesBuilt, Evaluated, EvaluationFailed, Forecasted, ForecastFailed };

std::string toString(PipelineStage stage);

struct PipelineResult {
	std::size_t feature_rows = 0;
	std::vector<std::string> feature_names;

	std::optional<validation::EvaluationReport> evaluation;
	std::optional<StageError> evaluation_error;

	std::optional<validation::HoldoutReport> holdout;
	std::optional<StageError> holdout_error;

	std::optional<forecast::ForecastReport> forecast;
	std::optional<StageError> forecast_error;

	// States visited during the run, starting and ending with Idle
	std::vector<PipelineStage> trace;

	bool succeeded() const noexcept {
		return evaluation.has_value() && forecast.has_value();
	}
};

/**
 * @class ForecastPipeline
 * @brief Runs feature building, walk-forward evaluation and forecasting in sequence.
 *
 * Idle -> FeaturesBuilt -> {Evaluated | EvaluationFailed} -> {Forecasted |
 * ForecastFailed} -> Idle. Feature-stage errors propagate to the caller.
 * Evaluation and forecast failures are recorded in the result as a StageError
 * and the run moves on; nothing is substituted for the missing output.
 */
class ForecastPipeline {
public:
	/// @throws core::UnknownModelError, std::invalid_argument If the configuration is invalid.
	explicit ForecastPipeline(PipelineConfig config);

	/**
	 * @throws core::InvalidSeriesError, core::InsufficientHistoryError From the feature stage.
	 */
	PipelineResult run(const core::PriceSeries &series, const features::IndicatorColumns &indicators = {});

	PipelineStage stage() const noexcept {
		return stage_;
	}

	const PipelineConfig &config() const noexcept {
		return config_;
	}

private:
	void transition(PipelineResult &result, PipelineStage next);

	PipelineConfig config_;
	PipelineStage stage_ = PipelineStage::Idle;
};

} // namespace pricecast::pipeline
