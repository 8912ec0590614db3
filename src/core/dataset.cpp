#include "pricecast/core/dataset.hpp"

#include <stdexcept>

namespace pricecast::core {

Dataset Dataset::slice(std::size_t first, std::size_t last) const {
	if (first > last || last > rows()) {
		throw std::out_of_range("Dataset slice is out of range.");
	}
	const auto count = static_cast<Eigen::Index>(last - first);
	const auto start = static_cast<Eigen::Index>(first);

	Dataset result;
	result.feature_names = feature_names;
	result.features = features.middleRows(start, count);
	result.target = target.segment(start, count);
	if (!anchor_dates.empty()) {
		result.anchor_dates.assign(anchor_dates.begin() + static_cast<std::ptrdiff_t>(first),
		                           anchor_dates.begin() + static_cast<std::ptrdiff_t>(last));
	}
	return result;
}

Dataset Dataset::select(const std::vector<std::size_t> &indices) const {
	Dataset result;
	result.feature_names = feature_names;
	result.features.resize(static_cast<Eigen::Index>(indices.size()), features.cols());
	result.target.resize(static_cast<Eigen::Index>(indices.size()));
	for (std::size_t i = 0; i < indices.size(); ++i) {
		if (indices[i] >= rows()) {
			throw std::out_of_range("Dataset row index out of range.");
		}
		const auto row = static_cast<Eigen::Index>(indices[i]);
		result.features.row(static_cast<Eigen::Index>(i)) = features.row(row);
		result.target(static_cast<Eigen::Index>(i)) = target(row);
		if (!anchor_dates.empty()) {
			result.anchor_dates.push_back(anchor_dates[indices[i]]);
		}
	}
	return result;
}

void Dataset::validate() const {
	if (features.rows() != target.size()) {
		throw std::invalid_argument("Feature matrix and target vector must have the same number of rows.");
	}
	if (!feature_names.empty() && feature_names.size() != cols()) {
		throw std::invalid_argument("Feature names must match the number of feature columns.");
	}
	if (!anchor_dates.empty() && anchor_dates.size() != rows()) {
		throw std::invalid_argument("Anchor dates must match the number of rows.");
	}
}

} // namespace pricecast::core
