#include "oss-metrics/utils/logging.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

namespace ossmetrics::utils {

std::shared_ptr<spdlog::logger> Logging::logger_;

void Logging::init(spdlog::level::level_enum level) {
	if (!logger_) {
		// Another component may already have registered the name.
		logger_ = spdlog::get("oss-metrics");
		if (!logger_) {
			logger_ = spdlog::stdout_color_mt("oss-metrics");
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

} // namespace ossmetrics::utils
