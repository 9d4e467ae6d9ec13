#include "starclass/utils/logging.hpp"

#ifndef STARCLASS_NO_LOGGING
#include <spdlog/sinks/stdout_color_sinks.h>

namespace starclass::utils {

std::shared_ptr<spdlog::logger> Logging::logger_;

void Logging::init(spdlog::level::level_enum level) {
	if (!logger_) {
		logger_ = spdlog::get("starclass");
		if (!logger_) {
			logger_ = spdlog::stdout_color_mt("starclass");
		}
	}
	logger_->set_level(level);
	logger_->flush_on(level);
}

std::shared_ptr<spdlog::logger> &Logging::getLogger() {
	if (!logger_) {
		init();
	}
	return logger_;
}

} // namespace starclass::utils

#endif // STARCLASS_NO_LOGGING
