#include <catch2/catch_test_macros.hpp>

#include "common/series_helpers.hpp"
#include "pricecast/core/errors.hpp"
#include "pricecast/pipeline/forecast_pipeline.hpp"

#include <cmath>
#include <stdexcept>
#include <vector>

using namespace pricecast;
using pipeline::ForecastPipeline;
using pipeline::PipelineConfig;
using pipeline::PipelineStage;

TEST_CASE("Pipeline evaluates and forecasts a daily series", "[pipeline]") {
	const auto series = tests::helpers::makeSyntheticSeries(400);

	PipelineConfig config;
	config.horizon = 5;
	config.n_splits = 5;
	config.model_name = "Linear Regression";
	config.scaling = transform::ScalingMethod::Standard;
	ForecastPipeline pipeline(config);

	const auto result = pipeline.run(series);

	REQUIRE(result.succeeded());
	REQUIRE(result.feature_rows == 400 - 29 - 5);
	REQUIRE(result.feature_names.size() == 15);

	REQUIRE(result.evaluation->folds.size() == 5);
	REQUIRE(std::isfinite(result.evaluation->mean_r2));
	REQUIRE(result.evaluation->mean_r2 <= 1.0);
	REQUIRE(result.evaluation->std_r2 >= 0.0);

	const auto dates = result.forecast->dates();
	REQUIRE(dates.size() == 5);
	REQUIRE(dates.front() == core::addDays(series.lastDate(), 1));
	for (std::size_t i = 1; i < dates.size(); ++i) {
		REQUIRE(dates[i] > dates[i - 1]);
	}

	REQUIRE_FALSE(result.holdout.has_value());
	REQUIRE_FALSE(result.evaluation_error.has_value());
	REQUIRE_FALSE(result.forecast_error.has_value());
}

TEST_CASE("Pipeline records the stages it passes through", "[pipeline]") {
	ForecastPipeline pipeline(PipelineConfig{});
	REQUIRE(pipeline.stage() == PipelineStage::Idle);

	const auto result = pipeline.run(tests::helpers::makeSyntheticSeries(150));

	const std::vector<PipelineStage> expected{PipelineStage::Idle, PipelineStage::FeaturesBuilt,
	                                          PipelineStage::Evaluated, PipelineStage::Forecasted,
	                                          PipelineStage::Idle};
	REQUIRE(result.trace == expected);
	REQUIRE(pipeline.stage() == PipelineStage::Idle);
	REQUIRE(pipeline::toString(PipelineStage::EvaluationFailed) == "EvaluationFailed");
}

TEST_CASE("Pipeline reports a holdout score when a test fraction is set", "[pipeline]") {
	PipelineConfig config;
	config.model_name = "KNN";
	config.n_splits = 3;
	config.test_fraction = 0.25;

	const auto result = ForecastPipeline(config).run(tests::helpers::makeSyntheticSeries(120));

	REQUIRE(result.holdout.has_value());
	REQUIRE(result.holdout->model_name == "KNN");
	REQUIRE(result.holdout->train_rows + result.holdout->test_rows == result.feature_rows);
	REQUIRE(std::isfinite(result.holdout->r2));
}

TEST_CASE("Pipeline runs are reproducible for a seed", "[pipeline]") {
	PipelineConfig config;
	config.model_name = "Extra Trees";
	config.n_splits = 3;
	config.horizon = 3;
	const auto series = tests::helpers::makeSyntheticSeries(160);

	const auto first = ForecastPipeline(config).run(series);
	const auto second = ForecastPipeline(config).run(series);

	REQUIRE(first.succeeded());
	REQUIRE(first.evaluation->scores() == second.evaluation->scores());
	REQUIRE(first.forecast->values() == second.forecast->values());
	REQUIRE(first.forecast->feature_importances == second.forecast->feature_importances);
}

TEST_CASE("Pipeline surfaces feature-stage errors", "[pipeline][error]") {
	ForecastPipeline pipeline(PipelineConfig{});

	REQUIRE_THROWS_AS(pipeline.run(tests::helpers::makeSyntheticSeries(10)), core::InsufficientHistoryError);
	REQUIRE(pipeline.stage() == PipelineStage::Idle);

	SECTION("Too few rows for the requested splits") {
		PipelineConfig config;
		config.n_splits = 20;
		// 45 bars leave 45 - 29 - 5 = 11 rows, fewer than 21
		REQUIRE_THROWS_AS(ForecastPipeline(config).run(tests::helpers::makeSyntheticSeries(45)),
		                  core::InsufficientHistoryError);
	}
}

TEST_CASE("Stage failures keep their stage, model and fold", "[pipeline][error]") {
	const core::PipelineError fold_failure("Model produced non-finite predictions.", "evaluation", "KNN", 3);
	const auto recorded = pipeline::describeFailure(fold_failure, "forecast", "Linear Regression");
	REQUIRE(recorded.stage == "evaluation");
	REQUIRE(recorded.model_name == "KNN");
	REQUIRE(recorded.fold_index == std::size_t{3});
	REQUIRE(recorded.detail == "Model produced non-finite predictions.");
	REQUIRE(recorded.message == fold_failure.what());

	const std::runtime_error plain("singular matrix");
	const auto fallback = pipeline::describeFailure(plain, "forecast", "Linear Regression");
	REQUIRE(fallback.stage == "forecast");
	REQUIRE(fallback.model_name == "Linear Regression");
	REQUIRE_FALSE(fallback.fold_index.has_value());
	REQUIRE(fallback.detail == "singular matrix");
}

TEST_CASE("Pipeline configuration is validated up front", "[pipeline][error]") {
	PipelineConfig config;

	SECTION("Unknown model") {
		config.model_name = "Unknown";
		REQUIRE_THROWS_AS(ForecastPipeline(config), core::UnknownModelError);
	}
	SECTION("Non-positive horizon") {
		config.horizon = 0;
		REQUIRE_THROWS_AS(ForecastPipeline(config), std::invalid_argument);
	}
	SECTION("Too few splits") {
		config.n_splits = 1;
		REQUIRE_THROWS_AS(ForecastPipeline(config), std::invalid_argument);
	}
	SECTION("Test fraction out of range") {
		config.test_fraction = 1.5;
		REQUIRE_THROWS_AS(ForecastPipeline(config), std::invalid_argument);
	}
}
