#pragma once

#include <xgboost/c_api.h>

#include <cstddef>
#include <string>
#include <vector>

namespace pricecast::models {

/// @throws std::runtime_error Carrying XGBGetLastError() when @p ret is non-zero.
void checkXgBoost(int ret);

/**
 * @class XgbDMatrix
 * @brief Owns a DMatrixHandle built from dense row-major floats.
 */
class XgbDMatrix {
public:
	XgbDMatrix() = default;
	~XgbDMatrix();

	XgbDMatrix(const XgbDMatrix &) = delete;
	XgbDMatrix &operator=(const XgbDMatrix &) = delete;
	XgbDMatrix(XgbDMatrix &&other) noexcept;
	XgbDMatrix &operator=(XgbDMatrix &&other) noexcept;

	/// NaN cells are treated as missing.
	void create(const float *row_major, std::size_t nrow, std::size_t ncol);
	void setLabels(const std::vector<float> &labels);

	DMatrixHandle get() const noexcept {
		return handle_;
	}

private:
	DMatrixHandle handle_ {nullptr};
};

/**
 * @class XgbBooster
 * @brief Owns a BoosterHandle bound to one training matrix.
 */
class XgbBooster {
public:
	XgbBooster() = default;
	~XgbBooster();

	XgbBooster(const XgbBooster &) = delete;
	XgbBooster &operator=(const XgbBooster &) = delete;
	XgbBooster(XgbBooster &&other) noexcept;
	XgbBooster &operator=(XgbBooster &&other) noexcept;

	void create(const XgbDMatrix &train);
	void setParam(const std::string &name, const std::string &value);
	void updateOneIter(int iteration, const XgbDMatrix &train);

	/// One prediction per row, summed over every boosted tree.
	std::vector<float> predict(const XgbDMatrix &data) const;

	/// Total split gain per feature; features never split on get zero.
	std::vector<double> totalGain(std::size_t n_features) const;

	BoosterHandle get() const noexcept {
		return handle_;
	}

private:
	BoosterHandle handle_ {nullptr};
};

} // namespace pricecast::models
