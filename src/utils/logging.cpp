#include "stockcast/utils/logging.hpp"

#ifndef STOCKCAST_NO_LOGGING
#include <spdlog/sinks/stdout_color_sinks.h>

namespace stockcast::utils {

std::shared_ptr<spdlog::logger> Logging::logger_;

void Logging::init(spdlog::level::level_enum level) {
	if (!logger_) {
		logger_ = spdlog::get("stockcast");
		if (!logger_) {
			logger_ = spdlog::stderr_color_mt("stockcast");
		}
	}
	logger_->set_level(level);
	logger_->flush_on(spdlog::level::warn);
}

std::shared_ptr<spdlog::logger> &Logging::getLogger() {
	if (!logger_) {
		init();
	}
	return logger_;
}

} // namespace stockcast::utils

#endif // STOCKCAST_NO_LOGGING
