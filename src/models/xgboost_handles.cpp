#include "pricecast/models/xgboost_handles.hpp"

#include <cmath>
#include <cstdlib>
#include <stdexcept>

namespace pricecast::models {

void checkXgBoost(int ret) {
	if (ret != 0) {
		const char *message = XGBGetLastError();
		throw std::runtime_error(std::string("XGBoost error: ") + (message ? message : "unknown"));
	}
}

// ============================================================================
// XgbDMatrix
// ============================================================================

XgbDMatrix::~XgbDMatrix() {
	if (handle_) {
		XGDMatrixFree(handle_);
	}
}

XgbDMatrix::XgbDMatrix(XgbDMatrix &&other) noexcept : handle_(other.handle_) {
	other.handle_ = nullptr;
}

XgbDMatrix &XgbDMatrix::operator=(XgbDMatrix &&other) noexcept {
	if (this != &other) {
		if (handle_) {
			XGDMatrixFree(handle_);
		}
		handle_ = other.handle_;
		other.handle_ = nullptr;
	}
	return *this;
}

void XgbDMatrix::create(const float *row_major, std::size_t nrow, std::size_t ncol) {
	if (handle_) {
		XGDMatrixFree(handle_);
		handle_ = nullptr;
	}
	checkXgBoost(XGDMatrixCreateFromMat(row_major, static_cast<bst_ulong>(nrow), static_cast<bst_ulong>(ncol),
	                                    std::nanf(""), &handle_));
}

void XgbDMatrix::setLabels(const std::vector<float> &labels) {
	checkXgBoost(XGDMatrixSetFloatInfo(handle_, "label", labels.data(), static_cast<bst_ulong>(labels.size())));
}

// ============================================================================
// XgbBooster
// ============================================================================

XgbBooster::~XgbBooster() {
	if (handle_) {
		XGBoosterFree(handle_);
	}
}

XgbBooster::XgbBooster(XgbBooster &&other) noexcept : handle_(other.handle_) {
	other.handle_ = nullptr;
}

XgbBooster &XgbBooster::operator=(XgbBooster &&other) noexcept {
	if (this != &other) {
		if (handle_) {
			XGBoosterFree(handle_);
		}
		handle_ = other.handle_;
		other.handle_ = nullptr;
	}
	return *this;
}

void XgbBooster::create(const XgbDMatrix &train) {
	if (handle_) {
		XGBoosterFree(handle_);
		handle_ = nullptr;
	}
	DMatrixHandle cache[] = {train.get()};
	checkXgBoost(XGBoosterCreate(cache, 1, &handle_));
}

void XgbBooster::setParam(const std::string &name, const std::string &value) {
	checkXgBoost(XGBoosterSetParam(handle_, name.c_str(), value.c_str()));
}

void XgbBooster::updateOneIter(int iteration, const XgbDMatrix &train) {
	checkXgBoost(XGBoosterUpdateOneIter(handle_, iteration, train.get()));
}

std::vector<float> XgbBooster::predict(const XgbDMatrix &data) const {
	// iteration_end 0 uses every tree
	const char *config =
	    "{\"type\": 0, \"training\": false, \"iteration_begin\": 0, \"iteration_end\": 0, \"strict_shape\": false}";
	bst_ulong const *out_shape = nullptr;
	bst_ulong out_dim = 0;
	const float *out_result = nullptr;
	checkXgBoost(XGBoosterPredictFromDMatrix(handle_, data.get(), config, &out_shape, &out_dim, &out_result));

	bst_ulong length = out_dim == 0 ? 0 : 1;
	for (bst_ulong d = 0; d < out_dim; ++d) {
		length *= out_shape[d];
	}
	return std::vector<float>(out_result, out_result + length);
}

std::vector<double> XgbBooster::totalGain(std::size_t n_features) const {
	const char *config = "{\"importance_type\": \"total_gain\", \"feature_map\": \"\"}";
	bst_ulong n_scored = 0;
	char const **names = nullptr;
	bst_ulong out_dim = 0;
	bst_ulong const *out_shape = nullptr;
	const float *scores = nullptr;
	checkXgBoost(XGBoosterFeatureScore(handle_, config, &n_scored, &names, &out_dim, &out_shape, &scores));

	// Unnamed features are reported as "f<index>"
	std::vector<double> gains(n_features, 0.0);
	for (bst_ulong i = 0; i < n_scored; ++i) {
		const char *name = names[i];
		if (name == nullptr || name[0] != 'f') {
			throw std::runtime_error(std::string("Unexpected XGBoost feature name '") + (name ? name : "") + "'.");
		}
		char *end = nullptr;
		const auto index = std::strtoul(name + 1, &end, 10);
		if (end == name + 1 || *end != '\0' || index >= n_features) {
			throw std::runtime_error(std::string("Unexpected XGBoost feature name '") + name + "'.");
		}
		gains[index] += static_cast<double>(scores[i]);
	}
	return gains;
}

} // namespace pricecast::models
