#pragma once

#include <spdlog/spdlog.h>
#include <memory>

namespace ossmetrics::utils {

/**
 * @class Logging
 * @brief Process-wide access point to the library's spdlog logger.
 *
 * Every component logs through the same named logger so the embedding
 * application can set the level once at startup.
 */
class Logging {
public:
	/**
	 * @brief Gets the singleton logger instance, creating it on first use.
	 * @return A shared pointer to the spdlog logger.
	 */
	static std::shared_ptr<spdlog::logger> &getLogger();

	/**
	 * @brief Initializes the logger with a specific logging level.
	 * @param level The minimum level of messages to log.
	 */
	static void init(spdlog::level::level_enum level = spdlog::level::info);

private:
	Logging() = default;

	static std::shared_ptr<spdlog::logger> logger_;
};

} // namespace ossmetrics::utils

#define OSSM_TRACE(...)    ossmetrics::utils::Logging::getLogger()->trace(__VA_ARGS__)
#define OSSM_DEBUG(...)    ossmetrics::utils::Logging::getLogger()->debug(__VA_ARGS__)
#define OSSM_INFO(...)     ossmetrics::utils::Logging::getLogger()->info(__VA_ARGS__)
#define OSSM_WARN(...)     ossmetrics::utils::Logging::getLogger()->warn(__VA_ARGS__)
#define OSSM_ERROR(...)    ossmetrics::utils::Logging::getLogger()->error(__VA_ARGS__)
#define OSSM_CRITICAL(...) ossmetrics::utils::Logging::getLogger()->critical(__VA_ARGS__)
