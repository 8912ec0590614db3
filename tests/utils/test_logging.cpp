#include <catch2/catch_test_macros.hpp>

#include "pricecast/utils/logging.hpp"

#include <spdlog/spdlog.h>
#include <stdexcept>

using pricecast::utils::Logging;

TEST_CASE("Logging initializes singleton logger", "[utils][logging]") {
	auto &logger_ref = Logging::getLogger();
	REQUIRE(logger_ref);
	REQUIRE(logger_ref->name() == "pricecast");

	const auto first_level = logger_ref->level();

	Logging::init(spdlog::level::debug);
	auto &logger_after_init = Logging::getLogger();

	REQUIRE(logger_ref.get() == logger_after_init.get());
	REQUIRE(logger_after_init->level() == spdlog::level::debug);
	REQUIRE(logger_after_init->flush_level() == spdlog::level::debug);

	// Restore to original level for downstream tests
	logger_after_init->set_level(first_level);
	logger_after_init->flush_on(first_level);
}

TEST_CASE("Logging parses level names", "[utils][logging]") {
	REQUIRE(Logging::parseLevel("debug") == spdlog::level::debug);
	REQUIRE(Logging::parseLevel("warn") == spdlog::level::warn);
	REQUIRE(Logging::parseLevel("off") == spdlog::level::off);
	REQUIRE_THROWS_AS(Logging::parseLevel("verbose"), std::invalid_argument);
}
