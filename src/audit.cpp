#include "sgaudit/audit.hpp"
#include "sgaudit/log.hpp"
#include "sgaudit/rule_collector.hpp"

namespace sgaudit {

std::string audit_summary(std::size_t violation_count) {
    return "Audit complete. " + std::to_string(violation_count) + " insecure rules found.";
}

// ── AuditRunner ──────────────────────────────────────────────────────────────

AuditRunner::AuditRunner(SecurityGroupSource& source, MailSender& mailer, AuditConfig config)
    : source_(source), mailer_(mailer), config_(std::move(config)) {}

AuditResponse AuditRunner::run() const {
    auto groups = source_.list_security_groups();
    log_info("auditing " + std::to_string(groups.size()) + " security group(s)");

    AuditResponse response;
    response.result = find_violations(groups);
    for (const auto& v : response.result.violations)
        log_warn(describe(v));

    ReportDispatcher dispatcher(mailer_, config_.subject);
    response.dispatch = dispatcher.send_report(response.result.violations,
                                               config_.sender, config_.recipient);

    response.status_code = 200;
    response.body = audit_summary(response.result.count());
    log_info(response.body);
    return response;
}

} // namespace sgaudit
