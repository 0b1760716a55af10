#include "perfshift/utils/logging.hpp"

#ifndef PERFSHIFT_NO_LOGGING
#include <spdlog/sinks/stdout_color_sinks.h>

namespace perfshift::utils {

std::shared_ptr<spdlog::logger> Logging::logger_;

void Logging::init(spdlog::level::level_enum level) {
	if (!logger_) {
		logger_ = spdlog::get("perfshift");
		if (!logger_) {
			logger_ = spdlog::stdout_color_mt("perfshift");
		}
	}
	logger_->set_level(level);
	logger_->flush_on(level);
}

std::shared_ptr<spdlog::logger> &Logging::getLogger() {
	if (!logger_) {
		// First use without init().
		init();
	}
	return logger_;
}

} // namespace perfshift::utils

#endif // PERFSHIFT_NO_LOGGING
