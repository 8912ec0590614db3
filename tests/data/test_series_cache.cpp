#include <catch2/catch_test_macros.hpp>

#include "common/series_helpers.hpp"
#include "pricecast/data/series_cache.hpp"

#include <chrono>
#include <stdexcept>

using namespace pricecast;
using data::SeriesCache;
using data::SeriesKey;

namespace {

struct FakeClock {
	std::chrono::system_clock::time_point now{};

	void advance(std::chrono::seconds by) {
		now += by;
	}
};

} // namespace

TEST_CASE("Series cache fetches once within the time-to-live", "[data][cache]") {
	FakeClock clock;
	int fetches = 0;
	SeriesCache cache(
	    [&fetches](const SeriesKey &) {
		    ++fetches;
		    return tests::helpers::makeSyntheticSeries(10);
	    },
	    std::chrono::seconds(3600), [&clock] { return clock.now; });

	const SeriesKey key{"AAPL", core::makeDate(2023, 1, 1), core::makeDate(2024, 1, 1)};

	REQUIRE(cache.get(key).size() == 10);
	REQUIRE(cache.get(key).size() == 10);
	REQUIRE(fetches == 1);
	REQUIRE(cache.contains(key));

	clock.advance(std::chrono::seconds(3599));
	cache.get(key);
	REQUIRE(fetches == 1);

	clock.advance(std::chrono::seconds(1));
	REQUIRE_FALSE(cache.contains(key));
	cache.get(key);
	REQUIRE(fetches == 2);

	SECTION("Distinct ranges are cached separately") {
		const SeriesKey other{"AAPL", core::makeDate(2022, 1, 1), core::makeDate(2024, 1, 1)};
		cache.get(other);
		REQUIRE(fetches == 3);
		REQUIRE(cache.size() == 2);
	}
}

TEST_CASE("Series cache refresh, invalidate and clear", "[data][cache]") {
	FakeClock clock;
	int fetches = 0;
	SeriesCache cache(
	    [&fetches](const SeriesKey &) {
		    ++fetches;
		    return tests::helpers::makeSyntheticSeries(5);
	    },
	    std::chrono::seconds(60), [&clock] { return clock.now; });
	const SeriesKey key{"MSFT", core::makeDate(2023, 1, 1), core::makeDate(2023, 6, 1)};

	cache.get(key);
	cache.refresh(key);
	REQUIRE(fetches == 2);

	REQUIRE(cache.invalidate(key));
	REQUIRE_FALSE(cache.invalidate(key));
	cache.get(key);
	REQUIRE(fetches == 3);

	cache.clear();
	REQUIRE(cache.size() == 0);
	REQUIRE(cache.ttl() == std::chrono::seconds(60));
}

TEST_CASE("Series cache drops expired entries", "[data][cache]") {
	FakeClock clock;
	SeriesCache cache([](const SeriesKey &) { return tests::helpers::makeSyntheticSeries(5); },
	                  std::chrono::seconds(60), [&clock] { return clock.now; });
	const SeriesKey old_key{"IBM", core::makeDate(2023, 1, 1), core::makeDate(2023, 6, 1)};
	const SeriesKey new_key{"ORCL", core::makeDate(2023, 1, 1), core::makeDate(2023, 6, 1)};

	cache.get(old_key);
	clock.advance(std::chrono::seconds(30));
	cache.get(new_key);
	REQUIRE(cache.size() == 2);
	REQUIRE(cache.purgeExpired() == 0);

	// old_key expires at 60s, new_key at 90s
	clock.advance(std::chrono::seconds(40));
	REQUIRE(cache.purgeExpired() == 1);
	REQUIRE(cache.size() == 1);
	REQUIRE(cache.contains(new_key));

	SECTION("get() drops stale entries for other keys") {
		clock.advance(std::chrono::seconds(30));
		const SeriesKey third{"SAP", core::makeDate(2023, 1, 1), core::makeDate(2023, 6, 1)};
		cache.get(third);
		REQUIRE(cache.size() == 1);
		REQUIRE_FALSE(cache.contains(new_key));
		REQUIRE(cache.contains(third));
	}
}

TEST_CASE("Series cache rejects invalid keys and settings", "[data][cache][error]") {
	auto fetch = [](const SeriesKey &) { return tests::helpers::makeSyntheticSeries(5); };
	SeriesCache cache(fetch, std::chrono::seconds(60));

	REQUIRE_THROWS_AS(cache.get({"", core::makeDate(2023, 1, 1), core::makeDate(2023, 2, 1)}), std::invalid_argument);
	REQUIRE_THROWS_AS(cache.get({"AAPL", core::makeDate(2023, 2, 1), core::makeDate(2023, 2, 1)}),
	                  std::invalid_argument);

	REQUIRE_THROWS_AS(SeriesCache(fetch, std::chrono::seconds(-1)), std::invalid_argument);
	REQUIRE_THROWS_AS(SeriesCache(SeriesCache::FetchFn{}, std::chrono::seconds(60)), std::invalid_argument);
}
