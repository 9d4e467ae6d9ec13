#pragma once

#ifndef STARCLASS_NO_LOGGING
#include <spdlog/spdlog.h>
#include <memory>

namespace starclass::utils {

/**
 * @class Logging
 * @brief Provides a singleton interface to the spdlog logging library.
 *
 * A single logger instance is shared by the periodogram engine, the feature
 * extractors and the pipeline. It can be configured once at startup.
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

} // namespace starclass::utils

#define STARCLASS_TRACE(...)    starclass::utils::Logging::getLogger()->trace(__VA_ARGS__)
#define STARCLASS_DEBUG(...)    starclass::utils::Logging::getLogger()->debug(__VA_ARGS__)
#define STARCLASS_INFO(...)     starclass::utils::Logging::getLogger()->info(__VA_ARGS__)
#define STARCLASS_WARN(...)     starclass::utils::Logging::getLogger()->warn(__VA_ARGS__)
#define STARCLASS_ERROR(...)    starclass::utils::Logging::getLogger()->error(__VA_ARGS__)
#define STARCLASS_CRITICAL(...) starclass::utils::Logging::getLogger()->critical(__VA_ARGS__)

#else
// No-op logging when spdlog is compiled out

namespace starclass::utils {

class Logging {
public:
	static void init() {}
};

} // namespace starclass::utils

#define STARCLASS_TRACE(...)    do {} while(0)
#define STARCLASS_DEBUG(...)    do {} while(0)
#define STARCLASS_INFO(...)     do {} while(0)
#define STARCLASS_WARN(...)     do {} while(0)
#define STARCLASS_ERROR(...)    do {} while(0)
#define STARCLASS_CRITICAL(...) do {} while(0)

#endif // STARCLASS_NO_LOGGING
