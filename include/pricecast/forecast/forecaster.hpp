#pragma once

#include "pricecast/core/calendar.hpp"
#include "pricecast/core/dataset.hpp"
#include "pricecast/transform/scaler.hpp"

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace pricecast::forecast {

struct ForecastConfig {
	transform::ScalingMethod scaling = transform::ScalingMethod::Standard;
	unsigned int seed = 42;
};

struct ForecastPoint {
	core::Date date{};
	double value = 0.0;
};

/**
 * @brief Forward projection of one model.
 *
 * @c points has one entry per step, dated last_date + 1, 2, ... days.
 * @c feature_importances is present only for models that expose them.
 */
struct ForecastReport {
	std::string model_name;
	std::vector<ForecastPoint> points;
	std::optional<std::map<std::string, double>> feature_importances;

	std::vector<double> values() const;
	std::vector<core::Date> dates() const;
};

/**
 * @class Forecaster
 * @brief Direct multi-step forecasting from the trailing anchor rows.
 *
 * The scaler and model are fitted on every training row. Anchor row i, whose
 * target lies @c horizon bars past its own date, yields the prediction for step
 * i + 1; no prediction is fed back as an input.
 */
class Forecaster {
public:
	explicit Forecaster(ForecastConfig config = {});

	/**
	 * @throws core::UnknownModelError If @p model_name is not a registry key.
	 * @throws core::PipelineError If fitting or predicting fails.
	 */
	ForecastReport forecast(const core::FeatureSet &features, const std::string &model_name) const;

	const ForecastConfig &config() const noexcept {
		return config_;
	}

private:
	ForecastConfig config_;
};

} // namespace pricecast::forecast
