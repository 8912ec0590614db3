#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>
#include <cmath>
#include <stdexcept>
#include <vector>

#include "pricecast/utils/metrics.hpp"

using pricecast::utils::Metrics;

TEST_CASE("Metrics compute basic error statistics", "[utils][metrics]") {
	const std::vector<double> actual{1.0, 2.0, 3.0};
	const std::vector<double> predicted{1.5, 2.5, 2.0};

	const double expected_mse = (0.25 + 0.25 + 1.0) / 3.0;
	REQUIRE(Metrics::mae(actual, predicted) == Catch::Approx((0.5 + 0.5 + 1.0) / 3.0));
	REQUIRE(Metrics::mse(actual, predicted) == Catch::Approx(expected_mse));
	REQUIRE(Metrics::rmse(actual, predicted) == Catch::Approx(std::sqrt(expected_mse)));

	// ss_tot = 2, ss_res = 1.5
	const auto r2 = Metrics::r2(actual, predicted);
	REQUIRE(r2.has_value());
	REQUIRE(*r2 == Catch::Approx(0.25));

	const auto all = Metrics::score(actual, predicted);
	REQUIRE(all.n == 3);
	REQUIRE(all.r2 == Catch::Approx(0.25));
	REQUIRE(all.rmse == Catch::Approx(std::sqrt(expected_mse)));
}

TEST_CASE("Metrics handles invalid inputs", "[utils][metrics][error]") {
	const std::vector<double> actual{1.0, 2.0};
	const std::vector<double> predicted{1.0};

	REQUIRE_THROWS_AS(Metrics::mae(actual, predicted), std::invalid_argument);
	REQUIRE_THROWS_AS(Metrics::r2(actual, predicted), std::invalid_argument);
	REQUIRE_THROWS_AS(Metrics::score({}, {}), std::invalid_argument);
}

TEST_CASE("Metrics R2 handles degenerate variance", "[utils][metrics][r2]") {
	const std::vector<double> constant{2.0, 2.0, 2.0};

	REQUIRE_FALSE(Metrics::r2(constant, {1.0, 2.0, 3.0}).has_value());

	SECTION("Perfect prediction of a constant target scores one") {
		REQUIRE(Metrics::r2Score(constant, constant) == Catch::Approx(1.0));
	}
	SECTION("Any error on a constant target scores zero") {
		REQUIRE(Metrics::r2Score(constant, {2.0, 2.0, 2.5}) == Catch::Approx(0.0));
	}
}

TEST_CASE("Metrics R2 can be negative", "[utils][metrics][r2]") {
	const std::vector<double> actual{1.0, 2.0, 3.0};
	const std::vector<double> reversed{3.0, 2.0, 1.0};
	// ss_res = 8, ss_tot = 2
	REQUIRE(Metrics::r2Score(actual, reversed) == Catch::Approx(-3.0));
}

TEST_CASE("Metrics R2 anchors at one for a perfect fit and zero for the mean", "[utils][metrics][r2]") {
	const std::vector<double> actual{101.2, 99.8, 102.5, 100.1, 103.4};
	REQUIRE(Metrics::r2Score(actual, actual) == Catch::Approx(1.0));

	const double mean = (101.2 + 99.8 + 102.5 + 100.1 + 103.4) / 5.0;
	const std::vector<double> at_mean(actual.size(), mean);
	REQUIRE(Metrics::r2Score(actual, at_mean) == Catch::Approx(0.0).margin(1e-12));
}

TEST_CASE("Metrics R2 is scale-invariant for small prices", "[utils][metrics][r2]") {
	// ss_tot is about 2e-10, far below machine epsilon in absolute terms
	const std::vector<double> actual{1.0e-5, 2.0e-5, 3.0e-5};
	const std::vector<double> predicted{1.5e-5, 2.5e-5, 2.0e-5};

	const auto r2 = Metrics::r2(actual, predicted);
	REQUIRE(r2.has_value());
	REQUIRE(*r2 == Catch::Approx(0.25));

	// An error of 1e-9 on a constant 1e-9 target is not a perfect fit
	const std::vector<double> tiny{1.0e-9, 1.0e-9, 1.0e-9};
	REQUIRE_FALSE(Metrics::r2(tiny, {2.0e-9, 1.0e-9, 1.0e-9}).has_value());
	REQUIRE(Metrics::r2Score(tiny, {2.0e-9, 1.0e-9, 1.0e-9}) == Catch::Approx(0.0));
}
