#include "core/logging.hpp"
#include <algorithm>
#include <atomic>
#include <cctype>
#include <iostream>
#include <mutex>

namespace core {

namespace {
std::atomic<int> g_level{static_cast<int>(LogLevel::Info)};
std::mutex g_log_mutex; // worker threads log concurrently

void write_line(LogLevel level, const char* tag, const std::string& msg) {
    if (!log_enabled(level)) return;
    std::lock_guard<std::mutex> lock(g_log_mutex);
    std::cerr << "[" << tag << "] " << msg << std::endl;
}
} // namespace

void set_log_level(LogLevel level) { g_level.store(static_cast<int>(level)); }

LogLevel log_level() { return static_cast<LogLevel>(g_level.load()); }

bool log_enabled(LogLevel level) {
    return level != LogLevel::Off && static_cast<int>(level) >= g_level.load();
}

bool parse_log_level(const std::string& name, LogLevel& out) {
    std::string s = name;
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (s == "debug") { out = LogLevel::Debug; return true; }
    if (s == "info") { out = LogLevel::Info; return true; }
    if (s == "warn" || s == "warning") { out = LogLevel::Warn; return true; }
    if (s == "error") { out = LogLevel::Error; return true; }
    if (s == "off") { out = LogLevel::Off; return true; }
    return false;
}

void log_debug(const std::string& msg) { write_line(LogLevel::Debug, "DEBUG", msg); }
void log_info(const std::string& msg) { write_line(LogLevel::Info, "INFO", msg); }
void log_warn(const std::string& msg) { write_line(LogLevel::Warn, "WARN", msg); }
void log_error(const std::string& msg) { write_line(LogLevel::Error, "ERROR", msg); }
}
