#pragma once

#include "pricecast/core/dataset.hpp"

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace pricecast::transform {

enum class ScalingMethod { None, Standard, Robust, MinMax };

/// Parses "none", "standard", "robust" or "minmax" (case-insensitive).
ScalingMethod parseScalingMethod(const std::string &name);
std::string toString(ScalingMethod method);

/**
 * @brief Per-feature affine parameters: x' = (x - center) / scale.
 *
 * Features listed in @c degenerate had zero spread in the fitted data and are
 * passed through unchanged (center 0, scale 1).
 */
struct ScaleParams {
	std::vector<double> center;
	std::vector<double> scale;
	std::vector<std::size_t> degenerate;
};

/**
 * @class Scaler
 * @brief Column-wise feature normalization fitted on training rows only.
 *
 * Each variant decides the center and spread of a single column; the base class
 * applies them and handles features whose spread is zero.
 */
class Scaler {
public:
	virtual ~Scaler() = default;

	/**
	 * @brief Learns per-column parameters from @p data.
	 * @param feature_names Optional names used when reporting degenerate features.
	 * @throws std::invalid_argument If @p data has no rows.
	 */
	void fit(const core::Matrix &data, const std::vector<std::string> &feature_names = {});

	/// @throws std::runtime_error If called before fit.
	void transform(core::Matrix &data) const;

	void inverseTransform(core::Matrix &data) const;

	void fitTransform(core::Matrix &data, const std::vector<std::string> &feature_names = {}) {
		fit(data, feature_names);
		transform(data);
	}

	[[nodiscard]] bool isFitted() const noexcept {
		return params_.has_value();
	}

	/// @throws std::runtime_error If called before fit.
	const ScaleParams &params() const;

	/// Indices of features that fell back to identity scaling.
	const std::vector<std::size_t> &degenerateFeatures() const;

	virtual ScalingMethod method() const = 0;

protected:
	/// Center and spread of one column; @p column may be reordered.
	virtual std::pair<double, double> columnParams(std::vector<double> &column) const = 0;

private:
	void ensureParams() const;

	std::optional<ScaleParams> params_;
};

class IdentityScaler final : public Scaler {
public:
	ScalingMethod method() const override {
		return ScalingMethod::None;
	}

protected:
	std::pair<double, double> columnParams(std::vector<double> &column) const override;
};

/// Zero mean, unit (population) variance.
class StandardScaler final : public Scaler {
public:
	ScalingMethod method() const override {
		return ScalingMethod::Standard;
	}

protected:
	std::pair<double, double> columnParams(std::vector<double> &column) const override;
};

/// Median and interquartile range.
class RobustScaler final : public Scaler {
public:
	ScalingMethod method() const override {
		return ScalingMethod::Robust;
	}

protected:
	std::pair<double, double> columnParams(std::vector<double> &column) const override;
};

/// Maps the fitted range onto [0, 1].
class MinMaxScaler final : public Scaler {
public:
	ScalingMethod method() const override {
		return ScalingMethod::MinMax;
	}

protected:
	std::pair<double, double> columnParams(std::vector<double> &column) const override;
};

std::unique_ptr<Scaler> makeScaler(ScalingMethod method);

} // namespace pricecast::transform
