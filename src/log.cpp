#include "sgaudit/log.hpp"

#include <iostream>

namespace sgaudit {

namespace {
LogLevel g_level = LogLevel::Info;
}

std::optional<LogLevel> parse_log_level(const std::string& name) {
    if (name == "error") return LogLevel::Error;
    if (name == "warn")  return LogLevel::Warn;
    if (name == "info")  return LogLevel::Info;
    if (name == "debug") return LogLevel::Debug;
    return std::nullopt;
}

void set_log_level(LogLevel level) { g_level = level; }

LogLevel log_level() { return g_level; }

void log(LogLevel level, const std::string& message) {
    if (static_cast<int>(level) > static_cast<int>(g_level)) return;
    std::cerr << "sgaudit: [" << level << "] " << message << "\n";
}

} // namespace sgaudit
