#include "downhill/utils/logging.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

namespace downhill::utils {

std::shared_ptr<spdlog::logger> Logging::logger_;

void Logging::init(spdlog::level::level_enum level) {
	if (!logger_) {
		// Reuse a logger registered under the same name by an earlier owner.
		logger_ = spdlog::get("downhill");
		if (!logger_) {
			logger_ = spdlog::stdout_color_mt("downhill");
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

} // namespace downhill::utils
