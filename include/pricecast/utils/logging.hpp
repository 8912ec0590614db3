#pragma once

#include <spdlog/spdlog.h>
#include <memory>
#include <string>

namespace pricecast::utils {

/**
 * @class Logging
 * @brief Provides a singleton interface to the spdlog logging library.
 *
 * All pipeline stages log through one named logger, which can be configured
 * at startup.
 */
class Logging {
public:
	/**
	 * @brief Gets the singleton logger instance.
	 * @return A shared pointer to the spdlog logger.
	 */
	static std::shared_ptr<spdlog::logger> &getLogger();

	/**
	 * @brief Initializes the logger with a specific logging level.
	 * @param level The minimum level of messages to log.
	 */
	static void init(spdlog::level::level_enum level = spdlog::level::info);

	/**
	 * @brief Parses a level name ("trace", "debug", "info", "warn", "error", "critical", "off").
	 * @throws std::invalid_argument For an unrecognised name.
	 */
	static spdlog::level::level_enum parseLevel(const std::string &name);

private:
	Logging() = default;

	static std::shared_ptr<spdlog::logger> logger_;
};

} // namespace pricecast::utils

// --- Logger Macros for convenient access ---
#define PRICECAST_TRACE(...)    pricecast::utils::Logging::getLogger()->trace(__VA_ARGS__)
#define PRICECAST_DEBUG(...)    pricecast::utils::Logging::getLogger()->debug(__VA_ARGS__)
#define PRICECAST_INFO(...)     pricecast::utils::Logging::getLogger()->info(__VA_ARGS__)
#define PRICECAST_WARN(...)     pricecast::utils::Logging::getLogger()->warn(__VA_ARGS__)
#define PRICECAST_ERROR(...)    pricecast::utils::Logging::getLogger()->error(__VA_ARGS__)
#define PRICECAST_CRITICAL(...) pricecast::utils::Logging::getLogger()->critical(__VA_ARGS__)
