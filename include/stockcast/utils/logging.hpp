#pragma once

#ifndef STOCKCAST_NO_LOGGING
#include <spdlog/spdlog.h>
#include <memory>

namespace stockcast::utils {

/**
 * @class Logging
 * @brief Process-wide spdlog logger shared by the models and the demand pipeline.
 *
 * The logger is created lazily on first use; call init() at startup to choose
 * the level before any forecast runs.
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

} // namespace stockcast::utils

#define STOCKCAST_TRACE(...)    stockcast::utils::Logging::getLogger()->trace(__VA_ARGS__)
#define STOCKCAST_DEBUG(...)    stockcast::utils::Logging::getLogger()->debug(__VA_ARGS__)
#define STOCKCAST_INFO(...)     stockcast::utils::Logging::getLogger()->info(__VA_ARGS__)
#define STOCKCAST_WARN(...)     stockcast::utils::Logging::getLogger()->warn(__VA_ARGS__)
#define STOCKCAST_ERROR(...)    stockcast::utils::Logging::getLogger()->error(__VA_ARGS__)
#define STOCKCAST_CRITICAL(...) stockcast::utils::Logging::getLogger()->critical(__VA_ARGS__)

#else

namespace stockcast::utils {

class Logging {
public:
	static void init() {}
};

} // namespace stockcast::utils

#define STOCKCAST_TRACE(...)    do {} while(0)
#define STOCKCAST_DEBUG(...)    do {} while(0)
#define STOCKCAST_INFO(...)     do {} while(0)
#define STOCKCAST_WARN(...)     do {} while(0)
#define STOCKCAST_ERROR(...)    do {} while(0)
#define STOCKCAST_CRITICAL(...) do {} while(0)

#endif // STOCKCAST_NO_LOGGING
