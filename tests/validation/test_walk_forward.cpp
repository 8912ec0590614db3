#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include "common/series_helpers.hpp"
#include "pricecast/core/errors.hpp"
#include "pricecast/features/feature_builder.hpp"
#include "pricecast/validation/walk_forward.hpp"

#include <cmath>
#include <limits>
#include <stdexcept>
#include <string>
#include <vector>

using Catch::Approx;
using namespace pricecast;
using validation::WalkForwardConfig;
using validation::WalkForwardEvaluator;

TEST_CASE("generateFolds produces expanding equal-size test blocks", "[validation][walk_forward]") {
	const auto folds = WalkForwardEvaluator::generateFolds(100, 5);

	REQUIRE(folds.size() == 5);
	const std::vector<std::size_t> train_ends{20, 36, 52, 68, 84};
	for (std::size_t i = 0; i < folds.size(); ++i) {
		REQUIRE(folds[i].train_begin == 0);
		REQUIRE(folds[i].train_end == train_ends[i]);
		REQUIRE(folds[i].test_begin == folds[i].train_end);
		REQUIRE(folds[i].test_end - folds[i].test_begin == 16);
	}
	REQUIRE(folds.back().test_end == 100);
}

TEST_CASE("Folds never look ahead and training sets strictly grow", "[validation][walk_forward]") {
	for (std::size_t n : {6u, 37u, 250u, 1001u}) {
		for (std::size_t k : {2u, 3u, 5u}) {
			if (n < k + 1) {
				continue;
			}
			const auto folds = WalkForwardEvaluator::generateFolds(n, k);
			REQUIRE(folds.size() == k);
			for (std::size_t i = 0; i < folds.size(); ++i) {
				const auto &fold = folds[i];
				REQUIRE(fold.train_end > fold.train_begin);
				REQUIRE(fold.test_end > fold.test_begin);
				// Every training index is below every test index
				REQUIRE(fold.train_end <= fold.test_begin);
				REQUIRE(fold.test_end <= n);
				if (i > 0) {
					REQUIRE(fold.train_begin == folds[i - 1].train_begin);
					REQUIRE(fold.train_end > folds[i - 1].train_end);
				}
			}
		}
	}
}

TEST_CASE("generateFolds rejects impossible requests", "[validation][walk_forward][error]") {
	REQUIRE(WalkForwardEvaluator::generateFolds(6, 5).size() == 5);
	REQUIRE_THROWS_AS(WalkForwardEvaluator::generateFolds(5, 5), core::InsufficientHistoryError);
	REQUIRE_THROWS_AS(WalkForwardEvaluator::generateFolds(100, 1), std::invalid_argument);

	WalkForwardConfig config;
	config.n_splits = 1;
	REQUIRE_THROWS_AS(WalkForwardEvaluator(config), std::invalid_argument);
}

TEST_CASE("Walk-forward scores a perfectly linear target", "[validation][walk_forward]") {
	const auto data = tests::helpers::makeLinearDataset(120);
	WalkForwardEvaluator evaluator;

	const auto report = evaluator.evaluate(data, "Linear Regression");

	REQUIRE(report.model_name == "Linear Regression");
	REQUIRE(report.folds.size() == 5);
	REQUIRE(report.scores().size() == 5);
	for (const auto &fold : report.folds) {
		REQUIRE(fold.r2 == Approx(1.0));
		REQUIRE(fold.mae == Approx(0.0).margin(1e-8));
		REQUIRE(fold.predictions.size() == fold.actuals.size());
		REQUIRE(fold.degenerate_features.empty());
	}
	REQUIRE(report.mean_r2 == Approx(1.0));
	REQUIRE(report.std_r2 == Approx(0.0).margin(1e-8));
}

TEST_CASE("Aggregate is the mean and population deviation of fold scores", "[validation][walk_forward]") {
	validation::EvaluationReport report;
	for (double r2 : {0.2, 0.4, 0.6}) {
		validation::FoldResult fold;
		fold.r2 = r2;
		fold.mae = 1.0;
		fold.rmse = 2.0;
		report.folds.push_back(fold);
	}
	report.computeAggregatedMetrics();

	REQUIRE(report.mean_r2 == Approx(0.4));
	REQUIRE(report.std_r2 == Approx(std::sqrt(0.08 / 3.0)));
	REQUIRE(report.mean_mae == Approx(1.0));
	REQUIRE(report.mean_rmse == Approx(2.0));
}

TEST_CASE("Walk-forward evaluation is deterministic", "[validation][walk_forward]") {
	const auto features = features::FeatureBuilder().build(tests::helpers::makeSyntheticSeries(200), 5);
	WalkForwardConfig config;
	config.n_splits = 3;
	WalkForwardEvaluator evaluator(config);

	for (const auto *name : {"Random Forest", "Extra Trees", "XGBoost"}) {
		const auto first = evaluator.evaluate(features.training, name);
		const auto second = evaluator.evaluate(features.training, name);
		REQUIRE(first.scores() == second.scores());
		REQUIRE(first.mean_r2 == second.mean_r2);
		REQUIRE(first.std_r2 == second.std_r2);
		REQUIRE(std::isfinite(first.mean_r2));
		REQUIRE(first.mean_r2 <= 1.0);
	}
}

TEST_CASE("Each fold flags features that are constant in its training rows", "[validation][walk_forward]") {
	auto data = tests::helpers::makeLinearDataset(60);
	data.feature_names[2] = "flat";
	data.features.col(2).setConstant(4.0);

	const auto report = WalkForwardEvaluator().evaluate(data, "Linear Regression");
	for (const auto &fold : report.folds) {
		REQUIRE(fold.degenerate_features == std::vector<std::string>{"flat"});
		REQUIRE(fold.r2 == Approx(1.0));
	}
}

TEST_CASE("Each fold fits its scaler on its own training rows only", "[validation][walk_forward]") {
	// 30 rows, 2 splits: fold 0 trains on [0, 10) and tests on [10, 20); fold 1 trains on [0, 20)
	auto data = tests::helpers::makeLinearDataset(30);
	data.feature_names[2] = "regime";
	for (Eigen::Index r = 0; r < data.features.rows(); ++r) {
		data.features(r, 2) = r < 10 ? 1.0 : 1.0 + 0.1 * static_cast<double>(r);
	}

	WalkForwardConfig config;
	config.n_splits = 2;
	const auto report = WalkForwardEvaluator(config).evaluate(data, "Linear Regression");

	REQUIRE(report.folds.size() == 2);
	REQUIRE(report.folds[0].range.train_end == 10);
	REQUIRE(report.folds[0].degenerate_features == std::vector<std::string>{"regime"});
	REQUIRE(report.folds[1].degenerate_features.empty());
}

TEST_CASE("Walk-forward failures carry stage, model and fold", "[validation][walk_forward][error]") {
	WalkForwardEvaluator evaluator;

	REQUIRE_THROWS_AS(evaluator.evaluate(tests::helpers::makeLinearDataset(5), "Linear Regression"),
	                  core::InsufficientHistoryError);
	REQUIRE_THROWS_AS(evaluator.evaluate(tests::helpers::makeLinearDataset(50), "Unknown"), core::UnknownModelError);

	auto poisoned = tests::helpers::makeLinearDataset(60);
	poisoned.features(0, 0) = std::numeric_limits<double>::quiet_NaN();
	try {
		evaluator.evaluate(poisoned, "Linear Regression");
		FAIL("expected PipelineError");
	} catch (const core::PipelineError &e) {
		REQUIRE(e.stage() == "evaluation");
		REQUIRE(e.modelName() == "Linear Regression");
		REQUIRE(e.foldIndex() == std::size_t{0});
	}
}

TEST_CASE("Walk-forward accepts a bare matrix and target", "[validation][walk_forward]") {
	const auto data = tests::helpers::makeLinearDataset(30);
	WalkForwardConfig config;
	config.n_splits = 2;
	config.scaling = transform::ScalingMethod::MinMax;

	const auto report = WalkForwardEvaluator(config).evaluate(data.features, data.target, "KNN");
	REQUIRE(report.folds.size() == 2);
	REQUIRE(report.folds[0].range.train_end == 10);
	REQUIRE(report.folds[1].range.test_end == 30);
}
