#pragma once

#include "pricecast/core/calendar.hpp"

#include <cstddef>
#include <vector>

namespace pricecast::core {

/**
 * @struct Bar
 * @brief One daily OHLCV observation.
 */
struct Bar {
	Date date{};
	double open = 0.0;
	double high = 0.0;
	double low = 0.0;
	double close = 0.0;
	double volume = 0.0;
};

/**
 * @class PriceSeries
 * @brief An immutable, strictly date-ordered sequence of daily bars.
 *
 * Bars are stored column-wise so that feature construction can work on
 * contiguous price buffers. Construction rejects out-of-order or duplicated
 * dates with InvalidSeriesError; use sanitize() to de-duplicate first.
 */
class PriceSeries {
public:
	PriceSeries() = default;

	/**
	 * @brief Constructs a series from bars that are already sorted by date.
	 * @throws InvalidSeriesError If dates are not strictly increasing.
	 * @throws std::invalid_argument If a volume is negative or a price is not finite.
	 */
	explicit PriceSeries(const std::vector<Bar> &bars);

	/**
	 * @brief Sorts bars by date and drops duplicated dates.
	 *
	 * When a date occurs more than once the last occurrence in the input wins.
	 */
	static PriceSeries sanitize(std::vector<Bar> bars);

	std::size_t size() const noexcept {
		return dates_.size();
	}

	bool empty() const noexcept {
		return dates_.empty();
	}

	const std::vector<Date> &dates() const noexcept {
		return dates_;
	}
	const std::vector<double> &opens() const noexcept {
		return opens_;
	}
	const std::vector<double> &highs() const noexcept {
		return highs_;
	}
	const std::vector<double> &lows() const noexcept {
		return lows_;
	}
	const std::vector<double> &closes() const noexcept {
		return closes_;
	}
	const std::vector<double> &volumes() const noexcept {
		return volumes_;
	}

	Bar bar(std::size_t index) const;

	/// @throws std::out_of_range If the series is empty.
	const Date &lastDate() const;

	/// The most recent @p count bars (all bars when the series is shorter).
	PriceSeries tail(std::size_t count) const;

private:
	std::vector<Date> dates_;
	std::vector<double> opens_;
	std::vector<double> highs_;
	std::vector<double> lows_;
	std::vector<double> closes_;
	std::vector<double> volumes_;
};

} // namespace pricecast::core
