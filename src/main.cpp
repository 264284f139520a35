#include "sgaudit/audit.hpp"
#include "sgaudit/config.hpp"
#include "sgaudit/errors.hpp"
#include "sgaudit/group_source.hpp"
#include "sgaudit/json.hpp"
#include "sgaudit/log.hpp"
#include "sgaudit/mail.hpp"

#include <iostream>

using namespace sgaudit;

int main() {
    // ── Configuration ────────────────────────────────────────────────────────
    AuditConfig config;
    try {
        config = load_config(process_environment());
    } catch (const ConfigurationError& e) {
        log_error(std::string("configuration: ") + e.what());
        return 2;
    }
    set_log_level(config.log_level);

    // ── Collaborators ────────────────────────────────────────────────────────
    JsonSecurityGroupSource source(config.groups_file);
    SmtpMailSender mailer(config.smtp_host, config.smtp_port);

    // ── Audit ────────────────────────────────────────────────────────────────
    try {
        AuditRunner runner(source, mailer, config);
        auto response = runner.run();
        std::cout << to_json(response) << "\n";
    } catch (const CollectionError& e) {
        log_error(std::string("collecting security groups: ") + e.what());
        return 1;
    } catch (const DispatchError& e) {
        log_error(std::string("sending report: ") + e.what());
        return 1;
    }
    return 0;
}
