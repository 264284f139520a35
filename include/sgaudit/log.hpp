#pragma once

#include <optional>
#include <ostream>
#include <string>

namespace sgaudit {

enum class LogLevel { Error, Warn, Info, Debug };

inline std::ostream& operator<<(std::ostream& os, LogLevel l) {
    switch (l) {
        case LogLevel::Error: return os << "error";
        case LogLevel::Warn:  return os << "warn";
        case LogLevel::Info:  return os << "info";
        case LogLevel::Debug: return os << "debug";
        default:              return os << "unknown";
    }
}

std::optional<LogLevel> parse_log_level(const std::string& name);

void set_log_level(LogLevel level);
LogLevel log_level();

/// Writes "sgaudit: [level] message" to stderr when `level` is enabled.
void log(LogLevel level, const std::string& message);

inline void log_error(const std::string& m) { log(LogLevel::Error, m); }
inline void log_warn(const std::string& m)  { log(LogLevel::Warn, m); }
inline void log_info(const std::string& m)  { log(LogLevel::Info, m); }
inline void log_debug(const std::string& m) { log(LogLevel::Debug, m); }

} // namespace sgaudit
