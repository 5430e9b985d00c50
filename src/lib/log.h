#pragma once
#include <spdlog/spdlog.h>

namespace ienv {

// Name of the library's logger. Levels can be set with `SPDLOG_LEVEL=isolated-env=debug`.
constexpr const char* kLoggerName = "isolated-env";

/**
 * Returns the library logger, creating it on first use. Tests may attach extra sinks to it.
 */
auto Logger() -> spdlog::logger&;

} // namespace ienv
