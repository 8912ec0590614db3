#include "pricecast/models/lightgbm_handles.hpp"

#include <sstream>
#include <stdexcept>

namespace pricecast::models {

void checkLightGbm(int ret) {
	if (ret != 0) {
		throw std::runtime_error(std::string("LightGBM error: ") + LGBM_GetLastError());
	}
}

// ============================================================================
// LightGbmParams
// ============================================================================

LightGbmParams &LightGbmParams::set(const std::string &key, const std::string &value) {
	params_[key] = value;
	return *this;
}

LightGbmParams &LightGbmParams::set(const std::string &key, double value) {
	std::ostringstream out;
	out.precision(17);
	out << value;
	params_[key] = out.str();
	return *this;
}

LightGbmParams &LightGbmParams::set(const std::string &key, int value) {
	params_[key] = std::to_string(value);
	return *this;
}

std::string LightGbmParams::build() const {
	std::ostringstream out;
	bool first = true;
	for (const auto &[key, value] : params_) {
		if (!first) {
			out << ' ';
		}
		out << key << '=' << value;
		first = false;
	}
	return out.str();
}

// ============================================================================
// LightGbmDataset
// ============================================================================

LightGbmDataset::~LightGbmDataset() {
	if (handle_) {
		LGBM_DatasetFree(handle_);
	}
}

LightGbmDataset::LightGbmDataset(LightGbmDataset &&other) noexcept : handle_(other.handle_) {
	other.handle_ = nullptr;
}

LightGbmDataset &LightGbmDataset::operator=(LightGbmDataset &&other) noexcept {
	if (this != &other) {
		if (handle_) {
			LGBM_DatasetFree(handle_);
		}
		handle_ = other.handle_;
		other.handle_ = nullptr;
	}
	return *this;
}

void LightGbmDataset::create(const double *data, int32_t nrow, int32_t ncol, bool is_row_major,
                             const std::vector<float> &labels, const std::string &params) {
	if (static_cast<int32_t>(labels.size()) != nrow) {
		throw std::invalid_argument("LightGBM dataset needs one label per row.");
	}
	if (handle_) {
		LGBM_DatasetFree(handle_);
		handle_ = nullptr;
	}
	checkLightGbm(LGBM_DatasetCreateFromMat(data, C_API_DTYPE_FLOAT64, nrow, ncol, is_row_major ? 1 : 0,
	                                        params.c_str(), nullptr, &handle_));
	checkLightGbm(LGBM_DatasetSetField(handle_, "label", labels.data(), static_cast<int>(labels.size()),
	                                   C_API_DTYPE_FLOAT32));
}

// ============================================================================
// LightGbmBooster
// ============================================================================

LightGbmBooster::~LightGbmBooster() {
	if (handle_) {
		LGBM_BoosterFree(handle_);
	}
}

LightGbmBooster::LightGbmBooster(LightGbmBooster &&other) noexcept : handle_(other.handle_) {
	other.handle_ = nullptr;
}

LightGbmBooster &LightGbmBooster::operator=(LightGbmBooster &&other) noexcept {
	if (this != &other) {
		if (handle_) {
			LGBM_BoosterFree(handle_);
		}
		handle_ = other.handle_;
		other.handle_ = nullptr;
	}
	return *this;
}

void LightGbmBooster::create(const LightGbmDataset &dataset, const std::string &params) {
	if (handle_) {
		LGBM_BoosterFree(handle_);
		handle_ = nullptr;
	}
	checkLightGbm(LGBM_BoosterCreate(dataset.get(), params.c_str(), &handle_));
}

int LightGbmBooster::train(int iterations) {
	int completed = 0;
	for (int i = 0; i < iterations; ++i) {
		int is_finished = 0;
		checkLightGbm(LGBM_BoosterUpdateOneIter(handle_, &is_finished));
		++completed;
		if (is_finished) {
			break;
		}
	}
	return completed;
}

std::vector<double> LightGbmBooster::predict(const double *data, int32_t nrow, int32_t ncol,
                                             bool is_row_major) const {
	int64_t out_len = 0;
	checkLightGbm(LGBM_BoosterCalcNumPredict(handle_, nrow, C_API_PREDICT_NORMAL, 0, -1, &out_len));

	std::vector<double> result(static_cast<std::size_t>(out_len));
	int64_t actual_len = 0;
	checkLightGbm(LGBM_BoosterPredictForMat(handle_, data, C_API_DTYPE_FLOAT64, nrow, ncol, is_row_major ? 1 : 0,
	                                        C_API_PREDICT_NORMAL, 0, -1, "", &actual_len, result.data()));
	result.resize(static_cast<std::size_t>(actual_len));
	return result;
}

std::vector<double> LightGbmBooster::gainImportance(int32_t n_features) const {
	std::vector<double> result(static_cast<std::size_t>(n_features), 0.0);
	checkLightGbm(LGBM_BoosterFeatureImportance(handle_, 0, C_API_FEATURE_IMPORTANCE_GAIN, result.data()));
	return result;
}

} // namespace pricecast::models
