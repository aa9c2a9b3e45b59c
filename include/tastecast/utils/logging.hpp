#pragma once

#include <spdlog/spdlog.h>
#include <memory>
#include <string>

namespace tastecast::utils {

/**
 * @class Logging
 * @brief Provides a singleton interface to the spdlog logging library.
 *
 * Every pipeline stage logs through the same "tastecast" logger so the level
 * chosen by the configuration applies to the whole run.
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
	 * @throws std::invalid_argument If the name is not a known level.
	 */
	static spdlog::level::level_enum parseLevel(const std::string &name);

private:
	Logging() = default;

	static std::shared_ptr<spdlog::logger> logger_;
};

} // namespace tastecast::utils

// --- Logger Macros for convenient access ---
#define TASTECAST_TRACE(...)    tastecast::utils::Logging::getLogger()->trace(__VA_ARGS__)
#define TASTECAST_DEBUG(...)    tastecast::utils::Logging::getLogger()->debug(__VA_ARGS__)
#define TASTECAST_INFO(...)     tastecast::utils::Logging::getLogger()->info(__VA_ARGS__)
#define TASTECAST_WARN(...)     tastecast::utils::Logging::getLogger()->warn(__VA_ARGS__)
#define TASTECAST_ERROR(...)    tastecast::utils::Logging::getLogger()->error(__VA_ARGS__)
#define TASTECAST_CRITICAL(...) tastecast::utils::Logging::getLogger()->critical(__VA_ARGS__)
