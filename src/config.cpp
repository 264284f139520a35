#include "sgaudit/config.hpp"
#include "sgaudit/errors.hpp"

#include <cctype>
#include <cstdlib>

namespace sgaudit {

namespace {

std::optional<std::string> lookup(const EnvLookup& env, const std::string& key) {
    auto value = env(key);
    if (!value || value->empty()) return std::nullopt;
    return value;
}

std::string require(const EnvLookup& env, const std::string& key) {
    auto value = lookup(env, key);
    if (!value) {
        throw ConfigurationError("required setting " + key + " is not set");
    }
    return *value;
}

unsigned short parse_port(const std::string& key, const std::string& text) {
    bool digits = !text.empty() && text.size() <= 5;
    for (char c : text)
        if (!std::isdigit(static_cast<unsigned char>(c))) digits = false;

    long port = digits ? std::strtol(text.c_str(), nullptr, 10) : 0;
    if (port < 1 || port > 65535) {
        throw ConfigurationError(key + " must be a port number in 1..65535, got '" + text + "'");
    }
    return static_cast<unsigned short>(port);
}

} // namespace

EnvLookup process_environment() {
    return [](const std::string& key) -> std::optional<std::string> {
        const char* value = std::getenv(key.c_str());
        if (!value) return std::nullopt;
        return std::string(value);
    };
}

AuditConfig load_config(const EnvLookup& env) {
    AuditConfig config;
    config.sender    = require(env, "SGAUDIT_SENDER");
    config.recipient = require(env, "SGAUDIT_RECIPIENT");

    if (auto subject = lookup(env, "SGAUDIT_SUBJECT"))       config.subject = *subject;
    if (auto file = lookup(env, "SGAUDIT_GROUPS_FILE"))      config.groups_file = *file;
    if (auto host = lookup(env, "SGAUDIT_SMTP_HOST"))        config.smtp_host = *host;
    if (auto port = lookup(env, "SGAUDIT_SMTP_PORT"))
        config.smtp_port = parse_port("SGAUDIT_SMTP_PORT", *port);

    if (auto level = lookup(env, "SGAUDIT_LOG_LEVEL")) {
        auto parsed = parse_log_level(*level);
        if (!parsed) {
            throw ConfigurationError("SGAUDIT_LOG_LEVEL must be one of error, warn, info, debug; got '" +
                                     *level + "'");
        }
        config.log_level = *parsed;
    }
    return config;
}

} // namespace sgaudit
