#pragma once
#include <string>

namespace core {

enum class LogLevel {
    Debug = 0,
    Info,
    Warn,
    Error,
    Off
};

void set_log_level(LogLevel level);
LogLevel log_level();
bool log_enabled(LogLevel level);

// Accepts "debug", "info", "warn"/"warning", "error", "off" (case-insensitive).
// Returns false and leaves `out` untouched for anything else.
bool parse_log_level(const std::string& name, LogLevel& out);

void log_debug(const std::string& msg);
void log_info(const std::string& msg);
void log_warn(const std::string& msg);
void log_error(const std::string& msg);

}
