#include "log.h"
#include <spdlog/cfg/env.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <memory>

namespace ienv {

auto Logger() -> spdlog::logger& {
	static const std::shared_ptr<spdlog::logger> logger = []() {
		auto logger = spdlog::get(kLoggerName);
		if (!logger) {
			logger = spdlog::stderr_color_mt(kLoggerName);
			logger->set_level(spdlog::level::info);
			logger->flush_on(spdlog::level::warn);
			// Registered loggers pick up levels from SPDLOG_LEVEL
			spdlog::cfg::load_env_levels();
		}
		return logger;
	}();
	return *logger;
}

} // namespace ienv
