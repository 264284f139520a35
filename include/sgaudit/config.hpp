#pragma once

#include "sgaudit/log.hpp"
#include "sgaudit/report.hpp"
#include <functional>
#include <optional>
#include <string>

namespace sgaudit {

struct AuditConfig {
    std::string    sender;
    std::string    recipient;
    std::string    subject     = kReportSubject;
    std::string    groups_file = "-";
    std::string    smtp_host   = "localhost";
    unsigned short smtp_port   = 25;
    LogLevel       log_level   = LogLevel::Info;
};

using EnvLookup = std::function<std::optional<std::string>(const std::string&)>;

/// Reads variables from the process environment.
EnvLookup process_environment();

/**
 * Builds and validates an AuditConfig from SGAUDIT_* variables.
 * SGAUDIT_SENDER and SGAUDIT_RECIPIENT are required; empty counts as unset.
 * Throws ConfigurationError.
 */
AuditConfig load_config(const EnvLookup& env);

} // namespace sgaudit
