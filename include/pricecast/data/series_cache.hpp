#pragma once

#include "pricecast/core/calendar.hpp"
#include "pricecast/core/price_series.hpp"

#include <chrono>
#include <cstddef>
#include <functional>
#include <map>
#include <string>
#include <tuple>

namespace pricecast::data {

struct SeriesKey {
	std::string symbol;
	core::Date start{};
	core::Date end{};

	bool operator<(const SeriesKey &other) const {
		return std::tie(symbol, start, end) < std::tie(other.symbol, other.start, other.end);
	}
};

/**
 * @class SeriesCache
 * @brief Memoizes downloaded series per (symbol, start, end) for a fixed time-to-live.
 *
 * The fetch function and the clock are injected, so the cache has no global
 * state and can be driven deterministically in tests. Every get() first drops
 * entries older than the TTL, so a cache keyed by many symbols stays bounded
 * by what was fetched within one TTL.
 */
class SeriesCache {
public:
	using Clock = std::function<std::chrono::system_clock::time_point()>;
	using FetchFn = std::function<core::PriceSeries(const SeriesKey &)>;

	static std::chrono::system_clock::time_point systemClock() {
		return std::chrono::system_clock::now();
	}

	/// @throws std::invalid_argument If @p fetch is empty or @p ttl is negative.
	SeriesCache(FetchFn fetch, std::chrono::seconds ttl, Clock clock = systemClock);

	/**
	 * @brief Returns the cached series or fetches it when absent or expired.
	 * @throws std::invalid_argument If the symbol is empty or start is not before end.
	 */
	core::PriceSeries get(const SeriesKey &key);

	/// Fetches unconditionally and replaces the cached entry.
	core::PriceSeries refresh(const SeriesKey &key);

	/// @return true if an entry was removed.
	bool invalidate(const SeriesKey &key);

	/// Removes every expired entry; returns how many were dropped.
	std::size_t purgeExpired();

	void clear() noexcept {
		entries_.clear();
	}

	/// True when a fresh entry is cached for @p key.
	bool contains(const SeriesKey &key) const;

	std::size_t size() const noexcept {
		return entries_.size();
	}

	std::chrono::seconds ttl() const noexcept {
		return ttl_;
	}

private:
	struct Entry {
		core::PriceSeries series;
		std::chrono::system_clock::time_point fetched_at;
	};

	bool isFresh(const Entry &entry) const;

	FetchFn fetch_;
	std::chrono::seconds ttl_;
	Clock clock_;
	std::map<SeriesKey, Entry> entries_;
};

} // namespace pricecast::data
