#pragma once

#include "pricecast/core/dataset.hpp"
#include "pricecast/core/price_series.hpp"

#include <cstddef>
#include <map>
#include <string>
#include <vector>

namespace pricecast::features {

/**
 * @brief Precomputed indicator columns keyed by name, aligned with the series.
 *
 * Recognised keys: "sma", "ema", "rsi", "macd", "bb_high", "bb_low". NaN marks
 * positions where the indicator is undefined.
 */
using IndicatorColumns = std::map<std::string, std::vector<double>>;

/**
 * @brief Configuration of the feature set.
 */
struct FeatureConfig {
	std::vector<std::size_t> lags{1, 2, 3, 5, 8, 13, 21};
	std::vector<std::size_t> rolling_windows{5, 7, 14, 20, 30};
	std::size_t momentum_offset = 5;
	std::size_t volatility_window = 20;

	// Optional indicator block
	bool include_indicators = false;
	std::size_t sma_window = 14;
	std::size_t ema_window = 14;
	std::size_t rsi_window = 14;
	std::size_t macd_fast = 12;
	std::size_t macd_slow = 26;
	std::size_t bollinger_window = 20;
	double bollinger_std = 2.0;

	// Fewer training rows than this is reported as insufficient history
	std::size_t min_rows = 1;

	/// @throws std::invalid_argument For empty or zero-length windows.
	void validate() const;
};

/**
 * @class FeatureBuilder
 * @brief Turns a price series into a feature matrix and a horizon-shifted target.
 *
 * Each feature is computed by index arithmetic over the immutable close buffer,
 * giving one column aligned with the series. A row is kept only when every
 * feature and the target are defined, so with the default configuration the
 * training matrix has exactly size - lookback() - horizon rows.
 */
class FeatureBuilder {
public:
	explicit FeatureBuilder(FeatureConfig config = {});

	/**
	 * @brief Builds the training matrix and the forecast anchor rows.
	 * @param series Date-ordered bars.
	 * @param horizon Number of bars between a row's anchor and its target.
	 * @param indicators Optional external indicator columns (used when include_indicators is set).
	 * @throws std::invalid_argument If horizon <= 0 or an indicator column is misaligned.
	 * @throws core::InsufficientHistoryError If fewer than config().min_rows rows remain.
	 */
	core::FeatureSet build(const core::PriceSeries &series, int horizon,
	                       const IndicatorColumns &indicators = {}) const;

	/// Largest number of preceding bars any locally computed feature needs.
	std::size_t lookback() const;

	/// Feature names in column order.
	std::vector<std::string> featureNames() const;

	const FeatureConfig &config() const noexcept {
		return config_;
	}

private:
	enum class ColumnKind {
		Close,
		Lag,
		RollingMean,
		Momentum,
		Volatility,
		Sma,
		Ema,
		Rsi,
		Macd,
		BollingerUpper,
		BollingerLower
	};

	struct Column {
		ColumnKind kind = ColumnKind::Close;
		std::string name;
		std::size_t window = 0;
		std::size_t lookback = 0;
		std::vector<double> values;
	};

	std::vector<Column> computeColumns(const core::PriceSeries &series, const IndicatorColumns &indicators) const;
	std::vector<Column> describeColumns() const;

	FeatureConfig config_;
};

} // namespace pricecast::features
