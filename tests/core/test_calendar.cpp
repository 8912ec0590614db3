#include <catch2/catch_test_macros.hpp>

#include "pricecast/core/calendar.hpp"

#include <stdexcept>

using namespace pricecast::core;

TEST_CASE("parseDate and formatDate agree on ISO dates", "[core][calendar]") {
	REQUIRE(formatDate(parseDate("2024-02-29")) == "2024-02-29");
	REQUIRE(formatDate(parseDate("1999-12-31")) == "1999-12-31");
	REQUIRE(formatDate(makeDate(1970, 1, 1)) == "1970-01-01");
}

TEST_CASE("parseDate ignores a trailing time of day", "[core][calendar]") {
	REQUIRE(parseDate("2024-01-02 00:00:00") == makeDate(2024, 1, 2));
	REQUIRE(parseDate("2024-01-02T16:00:00-05:00") == makeDate(2024, 1, 2));
}

TEST_CASE("parseDate rejects malformed and impossible dates", "[core][calendar][error]") {
	REQUIRE_THROWS_AS(parseDate("02/01/2024"), std::invalid_argument);
	REQUIRE_THROWS_AS(parseDate("2023-02-29"), std::invalid_argument);
	REQUIRE_THROWS_AS(parseDate("2024-13-01"), std::invalid_argument);
	REQUIRE_THROWS_AS(parseDate("2024-01-02x"), std::invalid_argument);
}

TEST_CASE("addDays crosses month and year boundaries", "[core][calendar]") {
	REQUIRE(formatDate(addDays(makeDate(2023, 12, 30), 3)) == "2024-01-02");
	REQUIRE(formatDate(addDays(makeDate(2024, 2, 28), 1)) == "2024-02-29");
	REQUIRE(formatDate(addDays(makeDate(2024, 3, 1), -1)) == "2024-02-29");
}
