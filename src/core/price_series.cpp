#include "pricecast/core/price_series.hpp"
#include "pricecast/core/errors.hpp"
#include "pricecast/utils/logging.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace pricecast::core {

PriceSeries::PriceSeries(const std::vector<Bar> &bars) {
	dates_.reserve(bars.size());
	opens_.reserve(bars.size());
	highs_.reserve(bars.size());
	lows_.reserve(bars.size());
	closes_.reserve(bars.size());
	volumes_.reserve(bars.size());

	for (std::size_t i = 0; i < bars.size(); ++i) {
		const auto &bar = bars[i];
		if (i > 0 && !(bar.date > bars[i - 1].date)) {
			const bool duplicate = bar.date == bars[i - 1].date;
			throw InvalidSeriesError((duplicate ? "Duplicate date " : "Non-monotonic date ") + formatDate(bar.date) +
			                             " at bar " + std::to_string(i) + ".",
			                         "series");
		}
		if (!std::isfinite(bar.open) || !std::isfinite(bar.high) || !std::isfinite(bar.low) ||
		    !std::isfinite(bar.close)) {
			throw std::invalid_argument("Bar " + std::to_string(i) + " contains a non-finite price.");
		}
		// Returns and volatility divide by prior prices
		if (!(bar.open > 0.0) || !(bar.high > 0.0) || !(bar.low > 0.0) || !(bar.close > 0.0)) {
			throw std::invalid_argument("Bar " + std::to_string(i) + " on " + formatDate(bar.date) +
			                            " has a non-positive price.");
		}
		if (!(bar.volume >= 0.0)) {
			throw std::invalid_argument("Bar " + std::to_string(i) + " has a negative volume.");
		}
		dates_.push_back(bar.date);
		opens_.push_back(bar.open);
		highs_.push_back(bar.high);
		lows_.push_back(bar.low);
		closes_.push_back(bar.close);
		volumes_.push_back(bar.volume);
	}
}

PriceSeries PriceSeries::sanitize(std::vector<Bar> bars) {
	const auto original_size = bars.size();
	std::stable_sort(bars.begin(), bars.end(), [](const Bar &lhs, const Bar &rhs) { return lhs.date < rhs.date; });

	std::vector<Bar> unique;
	unique.reserve(bars.size());
	for (auto &bar : bars) {
		if (!unique.empty() && unique.back().date == bar.date) {
			unique.back() = bar;
		} else {
			unique.push_back(bar);
		}
	}

	if (unique.size() != original_size) {
		PRICECAST_WARN("Dropped {} duplicated bar(s) while sanitizing series.", original_size - unique.size());
	}
	return PriceSeries(unique);
}

Bar PriceSeries::bar(std::size_t index) const {
	if (index >= size()) {
		throw std::out_of_range("Bar index out of range.");
	}
	return Bar{dates_[index], opens_[index], highs_[index], lows_[index], closes_[index], volumes_[index]};
}

const Date &PriceSeries::lastDate() const {
	if (dates_.empty()) {
		throw std::out_of_range("Series is empty.");
	}
	return dates_.back();
}

PriceSeries PriceSeries::tail(std::size_t count) const {
	const std::size_t n = std::min(count, size());
	const std::size_t start = size() - n;
	PriceSeries result;
	result.dates_.assign(dates_.begin() + start, dates_.end());
	result.opens_.assign(opens_.begin() + start, opens_.end());
	result.highs_.assign(highs_.begin() + start, highs_.end());
	result.lows_.assign(lows_.begin() + start, lows_.end());
	result.closes_.assign(closes_.begin() + start, closes_.end());
	result.volumes_.assign(volumes_.begin() + start, volumes_.end());
	return result;
}

} // namespace pricecast::core
