#pragma once

#include <spdlog/spdlog.h>
#include <memory>

namespace downhill::utils {

/**
 * @class Logging
 * @brief Provides a singleton interface to the spdlog logging library.
 *
 * Every optimizer run writes through the same logger instance, which can be
 * configured once at startup.
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

private:
	Logging() = default;

	static std::shared_ptr<spdlog::logger> logger_;
};

} // namespace downhill::utils

// --- Logger Macros for convenient access ---
#define DOWNHILL_TRACE(...)    downhill::utils::Logging::getLogger()->trace(__VA_ARGS__)
#define DOWNHILL_DEBUG(...)    downhill::utils::Logging::getLogger()->debug(__VA_ARGS__)
#define DOWNHILL_INFO(...)     downhill::utils::Logging::getLogger()->info(__VA_ARGS__)
#define DOWNHILL_WARN(...)     downhill::utils::Logging::getLogger()->warn(__VA_ARGS__)
#define DOWNHILL_ERROR(...)    downhill::utils::Logging::getLogger()->error(__VA_ARGS__)
#define DOWNHILL_CRITICAL(...) downhill::utils::Logging::getLogger()->critical(__VA_ARGS__)
