#include "pricecast/features/feature_builder.hpp"
#include "pricecast/core/errors.hpp"
#include "pricecast/features/indicators.hpp"
#include "pricecast/utils/logging.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <optional>
#include <stdexcept>
#include <utility>

namespace pricecast::features {

namespace {

constexpr double kNaN = std::numeric_limits<double>::quiet_NaN();

void requirePositive(std::size_t value, const char *what) {
	if (value == 0) {
		throw std::invalid_argument(std::string(what) + " must be positive.");
	}
}

const std::vector<double> *findIndicator(const IndicatorColumns &indicators, const std::string &key) {
	auto it = indicators.find(key);
	return it == indicators.end() ? nullptr : &it->second;
}

} // namespace

void FeatureConfig::validate() const {
	for (auto lag : lags) {
		requirePositive(lag, "Lag offset");
	}
	for (auto window : rolling_windows) {
		requirePositive(window, "Rolling window");
	}
	requirePositive(momentum_offset, "Momentum offset");
	if (volatility_window < 2) {
		throw std::invalid_argument("Volatility window must be at least 2.");
	}
	if (include_indicators) {
		requirePositive(sma_window, "SMA window");
		requirePositive(ema_window, "EMA window");
		requirePositive(rsi_window, "RSI window");
		requirePositive(macd_fast, "MACD fast window");
		requirePositive(bollinger_window, "Bollinger window");
		if (macd_fast >= macd_slow) {
			throw std::invalid_argument("MACD fast window must be shorter than the slow window.");
		}
		if (!(bollinger_std > 0.0)) {
			throw std::invalid_argument("Bollinger band width must be positive.");
		}
	}
}

FeatureBuilder::FeatureBuilder(FeatureConfig config) : config_(std::move(config)) {
	config_.validate();
}

std::vector<FeatureBuilder::Column> FeatureBuilder::describeColumns() const {
	std::vector<Column> columns;
	columns.push_back({ColumnKind::Close, "close", 0, 0, {}});
	for (auto lag : config_.lags) {
		columns.push_back({ColumnKind::Lag, "lag_" + std::to_string(lag), lag, lag, {}});
	}
	for (auto window : config_.rolling_windows) {
		columns.push_back({ColumnKind::RollingMean, "rolling_mean_" + std::to_string(window), window, window - 1, {}});
	}
	columns.push_back({ColumnKind::Momentum, "momentum_" + std::to_string(config_.momentum_offset),
	                   config_.momentum_offset, config_.momentum_offset, {}});
	columns.push_back({ColumnKind::Volatility, "volatility_" + std::to_string(config_.volatility_window),
	                   config_.volatility_window, config_.volatility_window, {}});

	if (config_.include_indicators) {
		columns.push_back({ColumnKind::Sma, "sma", config_.sma_window, config_.sma_window - 1, {}});
		columns.push_back({ColumnKind::Ema, "ema", config_.ema_window, config_.ema_window - 1, {}});
		columns.push_back({ColumnKind::Rsi, "rsi", config_.rsi_window, config_.rsi_window - 1, {}});
		columns.push_back({ColumnKind::Macd, "macd", config_.macd_slow, config_.macd_slow - 1, {}});
		columns.push_back(
		    {ColumnKind::BollingerUpper, "bb_high", config_.bollinger_window, config_.bollinger_window - 1, {}});
		columns.push_back(
		    {ColumnKind::BollingerLower, "bb_low", config_.bollinger_window, config_.bollinger_window - 1, {}});
	}
	return columns;
}

std::size_t FeatureBuilder::lookback() const {
	std::size_t result = 0;
	for (const auto &column : describeColumns()) {
		result = std::max(result, column.lookback);
	}
	return result;
}

std::vector<std::string> FeatureBuilder::featureNames() const {
	std::vector<std::string> names;
	for (const auto &column : describeColumns()) {
		names.push_back(column.name);
	}
	return names;
}

std::vector<FeatureBuilder::Column> FeatureBuilder::computeColumns(const core::PriceSeries &series,
                                                                   const IndicatorColumns &indicators) const {
	const auto &close = series.closes();
	const std::size_t n = close.size();

	auto columns = describeColumns();
	std::optional<Indicators::BollingerBands> bands;

	for (auto &column : columns) {
		// External indicator columns take precedence over local computation
		const bool indicator = column.kind != ColumnKind::Close && column.kind != ColumnKind::Lag &&
		                       column.kind != ColumnKind::RollingMean && column.kind != ColumnKind::Momentum &&
		                       column.kind != ColumnKind::Volatility;
		if (const auto *external = indicator ? findIndicator(indicators, column.name) : nullptr) {
			if (external->size() != n) {
				throw std::invalid_argument("Indicator column '" + column.name + "' has " +
				                            std::to_string(external->size()) + " values, expected " +
				                            std::to_string(n) + ".");
			}
			column.values = *external;
			continue;
		}

		switch (column.kind) {
		case ColumnKind::Close:
			column.values = close;
			break;
		case ColumnKind::Lag:
			column.values.assign(n, kNaN);
			for (std::size_t t = column.window; t < n; ++t) {
				column.values[t] = close[t - column.window];
			}
			break;
		case ColumnKind::RollingMean:
			column.values = Indicators::sma(close, column.window);
			break;
		case ColumnKind::Momentum:
			column.values.assign(n, kNaN);
			for (std::size_t t = column.window; t < n; ++t) {
				column.values[t] = close[t] - close[t - column.window];
			}
			break;
		case ColumnKind::Volatility:
			column.values = Indicators::returnVolatility(close, column.window);
			break;
		case ColumnKind::Sma:
			column.values = Indicators::sma(close, column.window);
			break;
		case ColumnKind::Ema:
			column.values = Indicators::ema(close, column.window);
			break;
		case ColumnKind::Rsi:
			column.values = Indicators::rsi(close, column.window);
			break;
		case ColumnKind::Macd:
			column.values = Indicators::macd(close, config_.macd_fast, config_.macd_slow);
			break;
		case ColumnKind::BollingerUpper:
		case ColumnKind::BollingerLower:
			if (!bands) {
				bands = Indicators::bollinger(close, config_.bollinger_window, config_.bollinger_std);
			}
			column.values = column.kind == ColumnKind::BollingerUpper ? bands->upper : bands->lower;
			break;
		}
	}
	return columns;
}

core::FeatureSet FeatureBuilder::build(const core::PriceSeries &series, int horizon,
                                       const IndicatorColumns &indicators) const {
	if (horizon <= 0) {
		throw std::invalid_argument("Forecast horizon must be positive.");
	}
	const std::size_t n = series.size();
	const auto h = static_cast<std::size_t>(horizon);
	const std::size_t min_rows = std::max<std::size_t>(config_.min_rows, 1);

	if (n <= h) {
		throw core::InsufficientHistoryError("Series of " + std::to_string(n) + " bars is too short for horizon " +
		                                         std::to_string(horizon) + ".",
		                                     "features");
	}

	const auto columns = computeColumns(series, config_.include_indicators ? indicators : IndicatorColumns{});
	const auto &close = series.closes();

	auto rowDefined = [&columns](std::size_t t) {
		return std::all_of(columns.begin(), columns.end(),
		                   [t](const Column &column) { return std::isfinite(column.values[t]); });
	};

	std::vector<std::size_t> training_rows;
	for (std::size_t t = 0; t + h < n; ++t) {
		if (rowDefined(t) && std::isfinite(close[t + h])) {
			training_rows.push_back(t);
		}
	}

	if (training_rows.size() < min_rows) {
		throw core::InsufficientHistoryError("Only " + std::to_string(training_rows.size()) +
		                                         " complete feature rows from " + std::to_string(n) +
		                                         " bars (lookback " + std::to_string(lookback()) + ", horizon " +
		                                         std::to_string(horizon) + "); at least " +
		                                         std::to_string(min_rows) + " required.",
		                                     "features");
	}

	core::FeatureSet result;
	result.horizon = horizon;
	result.lookback = lookback();
	result.last_date = series.lastDate();

	auto &training = result.training;
	const auto width = static_cast<Eigen::Index>(columns.size());
	training.features.resize(static_cast<Eigen::Index>(training_rows.size()), width);
	training.target.resize(static_cast<Eigen::Index>(training_rows.size()));
	for (const auto &column : columns) {
		training.feature_names.push_back(column.name);
	}
	for (std::size_t r = 0; r < training_rows.size(); ++r) {
		const auto t = training_rows[r];
		const auto row = static_cast<Eigen::Index>(r);
		for (Eigen::Index c = 0; c < width; ++c) {
			training.features(row, c) = columns[static_cast<std::size_t>(c)].values[t];
		}
		training.target(row) = close[t + h];
		training.anchor_dates.push_back(series.dates()[t]);
	}

	// The trailing bars have features but their targets lie in the future
	result.forecast_features.resize(horizon, width);
	for (std::size_t i = 0; i < h; ++i) {
		const std::size_t t = n - h + i;
		if (!rowDefined(t)) {
			throw core::InsufficientHistoryError("Forecast anchor bar " + core::formatDate(series.dates()[t]) +
			                                         " has undefined features.",
			                                     "features");
		}
		for (Eigen::Index c = 0; c < width; ++c) {
			result.forecast_features(static_cast<Eigen::Index>(i), c) = columns[static_cast<std::size_t>(c)].values[t];
		}
		result.forecast_anchor_dates.push_back(series.dates()[t]);
	}

	PRICECAST_INFO("Built {} feature rows x {} features from {} bars (lookback {}, horizon {}).",
	               training.rows(), training.cols(), n, result.lookback, horizon);
	return result;
}

} // namespace pricecast::features
