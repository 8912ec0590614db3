#include "pricecast/core/errors.hpp"
#include "pricecast/data/csv_loader.hpp"
#include "pricecast/models/model_registry.hpp"
#include "pricecast/pipeline/forecast_pipeline.hpp"
#include "pricecast/utils/logging.hpp"

#include <algorithm>
#include <iomanip>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

using namespace pricecast;

namespace {

struct Options {
	std::string csv_path;
	pipeline::PipelineConfig config;
	std::string log_level = "info";
};

void printUsage(const char *program) {
	std::cerr << "Usage: " << program << " <prices.csv> [options]\n"
	          << "  --model NAME          one of:";
	for (const auto &name : models::ModelRegistry::names()) {
		std::cerr << " \"" << name << "\"";
	}
	std::cerr << "\n"
	          << "  --horizon N           days to forecast (default 5)\n"
	          << "  --splits K            walk-forward folds (default 5)\n"
	          << "  --scaling S           none | standard | robust | minmax (default standard)\n"
	          << "  --test-fraction F     also report a shuffled holdout split\n"
	          << "  --seed N              seed for stochastic models (default 42)\n"
	          << "  --indicators          add SMA/EMA/RSI/MACD/Bollinger features\n"
	          << "  --log-level L         trace | debug | info | warn | error | critical | off\n";
}

Options parseArguments(int argc, char **argv) {
	Options options;
	auto value = [&](int &i, const std::string &flag) -> std::string {
		if (i + 1 >= argc) {
			throw std::invalid_argument("Missing value for " + flag + ".");
		}
		return argv[++i];
	};

	for (int i = 1; i < argc; ++i) {
		const std::string arg = argv[i];
		if (arg == "--model") {
			options.config.model_name = value(i, arg);
		} else if (arg == "--horizon") {
			options.config.horizon = std::stoi(value(i, arg));
		} else if (arg == "--splits") {
			options.config.n_splits = static_cast<std::size_t>(std::stoul(value(i, arg)));
		} else if (arg == "--scaling") {
			options.config.scaling = transform::parseScalingMethod(value(i, arg));
		} else if (arg == "--test-fraction") {
			options.config.test_fraction = std::stod(value(i, arg));
		} else if (arg == "--seed") {
			options.config.seed = static_cast<unsigned int>(std::stoul(value(i, arg)));
		} else if (arg == "--indicators") {
			options.config.features.include_indicators = true;
		} else if (arg == "--log-level") {
			options.log_level = value(i, arg);
		} else if (!arg.empty() && arg[0] == '-') {
			throw std::invalid_argument("Unknown option " + arg + ".");
		} else if (options.csv_path.empty()) {
			options.csv_path = arg;
		} else {
			throw std::invalid_argument("Unexpected argument " + arg + ".");
		}
	}
	if (options.csv_path.empty()) {
		throw std::invalid_argument("No CSV file given.");
	}
	return options;
}

void printEvaluation(const validation::EvaluationReport &report) {
	std::cout << "\n=== Walk-forward evaluation: " << report.model_name << " ===\n\n";
	std::cout << std::left << std::setw(6) << "Fold" << std::setw(14) << "Train" << std::setw(14) << "Test"
	          << std::right << std::setw(10) << "R2" << std::setw(12) << "MAE" << std::setw(12) << "RMSE\n";
	for (const auto &fold : report.folds) {
		const auto train = "[0, " + std::to_string(fold.range.train_end) + ")";
		const auto test =
		    "[" + std::to_string(fold.range.test_begin) + ", " + std::to_string(fold.range.test_end) + ")";
		std::cout << std::left << std::setw(6) << fold.fold_id << std::setw(14) << train << std::setw(14) << test
		          << std::right << std::fixed << std::setprecision(4) << std::setw(10) << fold.r2
		          << std::setw(12) << fold.mae << std::setw(12) << fold.rmse << "\n";
		for (const auto &name : fold.degenerate_features) {
			std::cout << "      unscaled (zero spread): " << name << "\n";
		}
	}
	std::cout << "\nMean R2: " << report.mean_r2 << "  (std " << report.std_r2 << ")\n";
}

void printForecast(const forecast::ForecastReport &report) {
	std::cout << "\n=== Forecast: " << report.model_name << " ===\n\n";
	for (std::size_t i = 0; i < report.points.size(); ++i) {
		std::cout << "Day " << std::setw(2) << (i + 1) << "  " << core::formatDate(report.points[i].date) << "  "
		          << std::fixed << std::setprecision(2) << report.points[i].value << "\n";
	}

	if (report.feature_importances) {
		std::vector<std::pair<std::string, double>> ranked(report.feature_importances->begin(),
		                                                   report.feature_importances->end());
		std::sort(ranked.begin(), ranked.end(),
		          [](const auto &lhs, const auto &rhs) { return lhs.second > rhs.second; });
		std::cout << "\nFeature importances:\n";
		for (const auto &[name, score] : ranked) {
			std::cout << "  " << std::left << std::setw(18) << name << std::right << std::fixed
			          << std::setprecision(4) << score << "\n";
		}
	}
}

void printFailure(const char *what, const std::optional<pipeline::StageError> &error) {
	std::cout << "\n" << what << " failed";
	if (!error) {
		std::cout << ": unknown error\n";
		return;
	}
	std::cout << " in " << error->stage << " stage";
	if (!error->model_name.empty()) {
		std::cout << " (" << error->model_name;
		if (error->fold_index) {
			std::cout << ", fold " << *error->fold_index;
		}
		std::cout << ")";
	}
	std::cout << ": " << error->detail << "\n";
}

} // namespace

int main(int argc, char **argv) {
	Options options;
	try {
		options = parseArguments(argc, argv);
		utils::Logging::init(utils::Logging::parseLevel(options.log_level));
	} catch (const std::exception &e) {
		std::cerr << "Error: " << e.what() << "\n\n";
		printUsage(argv[0]);
		return 2;
	}

	try {
		const auto series = data::CsvSeriesLoader::load(options.csv_path);
		pipeline::ForecastPipeline pipeline(options.config);
		const auto result = pipeline.run(series);

		std::cout << "Series: " << series.size() << " bars, last " << core::formatDate(series.lastDate()) << "\n";
		std::cout << "Feature rows: " << result.feature_rows << " x " << result.feature_names.size() << "\n";

		if (result.evaluation) {
			printEvaluation(*result.evaluation);
		} else {
			printFailure("Evaluation", result.evaluation_error);
		}
		if (result.holdout) {
			std::cout << "\nHoldout (" << result.holdout->train_rows << " train / " << result.holdout->test_rows
			          << " test): R2 " << std::fixed << std::setprecision(4) << result.holdout->r2 << ", MAE "
			          << result.holdout->mae << "\n";
		} else if (result.holdout_error) {
			printFailure("Holdout", result.holdout_error);
		}
		if (result.forecast) {
			printForecast(*result.forecast);
		} else {
			printFailure("Forecast", result.forecast_error);
		}
		return result.succeeded() ? 0 : 1;
	} catch (const core::PipelineError &e) {
		PRICECAST_ERROR("{} stage failed: {}", e.stage(), e.detail());
		std::cerr << "Error: " << e.what() << "\n";
		return 1;
	} catch (const std::exception &e) {
		std::cerr << "Error: " << e.what() << "\n";
		return 1;
	}
}
