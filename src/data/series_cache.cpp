#include "pricecast/data/series_cache.hpp"
#include "pricecast/utils/logging.hpp"

#include <stdexcept>
#include <utility>

namespace pricecast::data {

namespace {

void validateKey(const SeriesKey &key) {
	if (key.symbol.empty()) {
		throw std::invalid_argument("Series symbol must not be empty.");
	}
	if (!(key.start < key.end)) {
		throw std::invalid_argument("Start date " + core::formatDate(key.start) + " must precede end date " +
		                            core::formatDate(key.end) + ".");
	}
}

} // namespace

SeriesCache::SeriesCache(FetchFn fetch, std::chrono::seconds ttl, Clock clock)
    : fetch_(std::move(fetch)), ttl_(ttl), clock_(std::move(clock)) {
	if (!fetch_) {
		throw std::invalid_argument("SeriesCache requires a fetch function.");
	}
	if (!clock_) {
		throw std::invalid_argument("SeriesCache requires a clock.");
	}
	if (ttl_.count() < 0) {
		throw std::invalid_argument("Cache time-to-live must be non-negative.");
	}
}

bool SeriesCache::isFresh(const Entry &entry) const {
	return clock_() - entry.fetched_at < ttl_;
}

std::size_t SeriesCache::purgeExpired() {
	std::size_t removed = 0;
	for (auto it = entries_.begin(); it != entries_.end();) {
		if (isFresh(it->second)) {
			++it;
		} else {
			it = entries_.erase(it);
			++removed;
		}
	}
	if (removed > 0) {
		PRICECAST_DEBUG("Dropped {} expired series from the cache.", removed);
	}
	return removed;
}

core::PriceSeries SeriesCache::get(const SeriesKey &key) {
	validateKey(key);
	purgeExpired();
	auto it = entries_.find(key);
	if (it != entries_.end()) {
		PRICECAST_DEBUG("Cache hit for {} [{}, {}].", key.symbol, core::formatDate(key.start),
		                core::formatDate(key.end));
		return it->second.series;
	}
	return refresh(key);
}

core::PriceSeries SeriesCache::refresh(const SeriesKey &key) {
	validateKey(key);
	auto series = fetch_(key);
	PRICECAST_INFO("Fetched {} bars for {} [{}, {}].", series.size(), key.symbol, core::formatDate(key.start),
	               core::formatDate(key.end));
	entries_[key] = Entry{series, clock_()};
	return series;
}

bool SeriesCache::invalidate(const SeriesKey &key) {
	return entries_.erase(key) > 0;
}

bool SeriesCache::contains(const SeriesKey &key) const {
	auto it = entries_.find(key);
	return it != entries_.end() && isFresh(it->second);
}

} // namespace pricecast::data
