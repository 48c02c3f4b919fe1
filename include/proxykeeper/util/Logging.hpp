#pragma once

#include <string>
#include <string_view>

namespace proxykeeper::util {

enum class LogLevel {
    trace,
    debug,
    info,
    warn,
    error
};

void initLogging(LogLevel level);
LogLevel currentLogLevel();
void log(LogLevel level, const std::string& message);

// Accepts "trace", "debug", "info", "warn"/"warning", "error" in any case.
// Unrecognised text yields LogLevel::info.
LogLevel parseLogLevel(std::string_view text);
const char* toString(LogLevel level);

} // namespace proxykeeper::util
