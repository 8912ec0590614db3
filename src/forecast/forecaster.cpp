#include "pricecast/forecast/forecaster.hpp"
#include "pricecast/core/errors.hpp"
#include "pricecast/models/model_registry.hpp"
#include "pricecast/utils/logging.hpp"

#include <stdexcept>
#include <string>
#include <utility>

namespace pricecast::forecast {

std::vector<double> ForecastReport::values() const {
	std::vector<double> out;
	out.reserve(points.size());
	for (const auto &point : points) {
		out.push_back(point.value);
	}
	return out;
}

std::vector<core::Date> ForecastReport::dates() const {
	std::vector<core::Date> out;
	out.reserve(points.size());
	for (const auto &point : points) {
		out.push_back(point.date);
	}
	return out;
}

Forecaster::Forecaster(ForecastConfig config) : config_(config) {
}

ForecastReport Forecaster::forecast(const core::FeatureSet &features, const std::string &model_name) const {
	models::ModelRegistry::validate(model_name);

	const auto &training = features.training;
	if (features.horizon <= 0) {
		throw std::invalid_argument("Forecast horizon must be positive.");
	}
	if (training.rows() == 0) {
		throw core::InsufficientHistoryError("No training rows to fit on.", "forecast", model_name);
	}
	if (features.forecast_features.rows() != features.horizon ||
	    features.forecast_features.cols() != training.features.cols()) {
		throw std::invalid_argument("Forecast anchor rows do not match the horizon and feature width.");
	}

	ForecastReport report;
	report.model_name = model_name;

	try {
		training.validate();
		core::Matrix train_features = training.features;
		core::Matrix anchors = features.forecast_features;

		auto scaler = transform::makeScaler(config_.scaling);
		scaler->fit(train_features, training.feature_names);
		scaler->transform(train_features);
		scaler->transform(anchors);

		auto model = models::ModelRegistry::create(model_name, config_.seed);
		model.fit(train_features, training.target);
		const core::Vector predicted = model.predict(anchors);
		if (!predicted.allFinite()) {
			throw core::PipelineError("Model produced non-finite predictions.", "forecast", model_name);
		}

		for (Eigen::Index i = 0; i < predicted.size(); ++i) {
			report.points.push_back({core::addDays(features.last_date, static_cast<long long>(i) + 1), predicted(i)});
		}

		if (auto importances = model.featureImportances()) {
			std::map<std::string, double> named;
			for (std::size_t c = 0; c < importances->size(); ++c) {
				const auto name =
				    c < training.feature_names.size() ? training.feature_names[c] : "#" + std::to_string(c);
				named[name] = (*importances)[c];
			}
			report.feature_importances = std::move(named);
		}
	} catch (const core::PipelineError &) {
		throw;
	} catch (const std::exception &e) {
		throw core::PipelineError(e.what(), "forecast", model_name);
	}

	PRICECAST_INFO("Forecast {} steps with '{}' from {} training rows.", report.points.size(), model_name,
	               training.rows());
	return report;
}

} // namespace pricecast::forecast
