#pragma once

#include <LightGBM/c_api.h>

#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace pricecast::models {

/// @throws std::runtime_error Carrying LGBM_GetLastError() when @p ret is non-zero.
void checkLightGbm(int ret);

/**
 * @brief Builds a LightGBM "key=value key=value" parameter string.
 */
class LightGbmParams {
public:
	LightGbmParams &set(const std::string &key, const std::string &value);
	LightGbmParams &set(const std::string &key, double value);
	LightGbmParams &set(const std::string &key, int value);

	std::string build() const;

private:
	std::map<std::string, std::string> params_;
};

/**
 * @class LightGbmDataset
 * @brief Owns a DatasetHandle.
 */
class LightGbmDataset {
public:
	LightGbmDataset() = default;
	~LightGbmDataset();

	LightGbmDataset(const LightGbmDataset &) = delete;
	LightGbmDataset &operator=(const LightGbmDataset &) = delete;
	LightGbmDataset(LightGbmDataset &&other) noexcept;
	LightGbmDataset &operator=(LightGbmDataset &&other) noexcept;

	/**
	 * @brief Creates the dataset from a dense matrix and attaches float labels.
	 * @param is_row_major False for column-major storage such as Eigen's default.
	 */
	void create(const double *data, int32_t nrow, int32_t ncol, bool is_row_major, const std::vector<float> &labels,
	            const std::string &params);

	DatasetHandle get() const noexcept {
		return handle_;
	}

private:
	DatasetHandle handle_ {nullptr};
};

/**
 * @class LightGbmBooster
 * @brief Owns a BoosterHandle.
 */
class LightGbmBooster {
public:
	LightGbmBooster() = default;
	~LightGbmBooster();

	LightGbmBooster(const LightGbmBooster &) = delete;
	LightGbmBooster &operator=(const LightGbmBooster &) = delete;
	LightGbmBooster(LightGbmBooster &&other) noexcept;
	LightGbmBooster &operator=(LightGbmBooster &&other) noexcept;

	void create(const LightGbmDataset &dataset, const std::string &params);

	/// Runs up to @p iterations boosting rounds; returns the number completed.
	int train(int iterations);

	std::vector<double> predict(const double *data, int32_t nrow, int32_t ncol, bool is_row_major) const;

	/// Total split gain per feature over all iterations.
	std::vector<double> gainImportance(int32_t n_features) const;

	BoosterHandle get() const noexcept {
		return handle_;
	}

private:
	BoosterHandle handle_ {nullptr};
};

} // namespace pricecast::models
