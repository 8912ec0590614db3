#include <catch2/catch_test_macros.hpp>

#include "common/series_helpers.hpp"
#include "pricecast/core/errors.hpp"
#include "pricecast/core/price_series.hpp"

#include <limits>
#include <stdexcept>
#include <string>
#include <vector>

using namespace pricecast::core;

namespace {

Bar makeBar(const Date &date, double close, double volume = 100.0) {
	return Bar{date, close, close, close, close, volume};
}

} // namespace

TEST_CASE("PriceSeries stores bars column-wise", "[core][series]") {
	const auto bars = tests::helpers::makeBars(5, [](std::size_t i) { return 10.0 + static_cast<double>(i); });
	PriceSeries series(bars);

	REQUIRE(series.size() == 5);
	REQUIRE(series.closes() == std::vector<double>{10.0, 11.0, 12.0, 13.0, 14.0});
	REQUIRE(series.dates().front() == tests::helpers::startDate());
	REQUIRE(series.lastDate() == addDays(tests::helpers::startDate(), 4));
	REQUIRE(series.bar(2).close == 12.0);
	REQUIRE_THROWS_AS(series.bar(5), std::out_of_range);
}

TEST_CASE("PriceSeries rejects duplicated dates", "[core][series][error]") {
	const auto day = makeDate(2024, 1, 2);
	std::vector<Bar> bars{makeBar(day, 1.0), makeBar(day, 2.0)};

	try {
		PriceSeries series(bars);
		FAIL("expected InvalidSeriesError");
	} catch (const InvalidSeriesError &e) {
		REQUIRE(e.stage() == "series");
		REQUIRE(e.detail().find("Duplicate date 2024-01-02") != std::string::npos);
	}
}

TEST_CASE("PriceSeries rejects out-of-order dates", "[core][series][error]") {
	std::vector<Bar> bars{makeBar(makeDate(2024, 1, 3), 1.0), makeBar(makeDate(2024, 1, 2), 2.0)};
	REQUIRE_THROWS_AS(PriceSeries(bars), InvalidSeriesError);
}

TEST_CASE("PriceSeries rejects negative volume and non-finite prices", "[core][series][error]") {
	REQUIRE_THROWS_AS(PriceSeries({makeBar(makeDate(2024, 1, 2), 1.0, -1.0)}), std::invalid_argument);

	auto bar = makeBar(makeDate(2024, 1, 2), 1.0);
	bar.high = std::numeric_limits<double>::infinity();
	REQUIRE_THROWS_AS(PriceSeries({bar}), std::invalid_argument);
}

TEST_CASE("PriceSeries rejects non-positive prices", "[core][series][error]") {
	auto bars = tests::helpers::makeBars(400, [](std::size_t i) { return 50.0 + 0.5 * static_cast<double>(i); });
	bars[200].close = 0.0;
	REQUIRE_THROWS_AS(PriceSeries(bars), std::invalid_argument);

	bars[200].close = 150.0;
	bars[200].low = -1.0;
	REQUIRE_THROWS_AS(PriceSeries(bars), std::invalid_argument);

	bars[200].low = 149.0;
	REQUIRE_NOTHROW(PriceSeries(bars));
}

TEST_CASE("sanitize sorts and keeps the last duplicate", "[core][series]") {
	std::vector<Bar> bars{makeBar(makeDate(2024, 1, 4), 4.0), makeBar(makeDate(2024, 1, 2), 2.0),
	                      makeBar(makeDate(2024, 1, 3), 3.0), makeBar(makeDate(2024, 1, 2), 2.5)};

	const auto series = PriceSeries::sanitize(bars);

	REQUIRE(series.size() == 3);
	REQUIRE(series.closes() == std::vector<double>{2.5, 3.0, 4.0});
	REQUIRE(formatDate(series.dates().front()) == "2024-01-02");
}

TEST_CASE("tail returns the most recent bars", "[core][series]") {
	const auto series = tests::helpers::makeLinearSeries(10, 1.0, 1.0);

	const auto last_three = series.tail(3);
	REQUIRE(last_three.closes() == std::vector<double>{8.0, 9.0, 10.0});
	REQUIRE(last_three.lastDate() == series.lastDate());
	REQUIRE(series.tail(50).size() == 10);
	REQUIRE(series.tail(0).empty());
}

TEST_CASE("lastDate on an empty series throws", "[core][series][error]") {
	PriceSeries empty;
	REQUIRE_THROWS_AS(empty.lastDate(), std::out_of_range);
}
