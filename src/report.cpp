#include "sgaudit/report.hpp"
#include "sgaudit/log.hpp"

namespace sgaudit {

std::string format_report(const std::vector<Violation>& violations) {
    std::string body = kReportHeader;
    body += "\n\n";
    for (const auto& v : violations) {
        body += describe(v);
        body += "\n";
    }
    return body;
}

// ── ReportDispatcher ─────────────────────────────────────────────────────────

ReportDispatcher::ReportDispatcher(MailSender& mailer, std::string subject)
    : mailer_(mailer), subject_(std::move(subject)) {}

DispatchOutcome ReportDispatcher::send_report(const std::vector<Violation>& violations,
                                              const std::string& sender,
                                              const std::string& recipient) const {
    if (violations.empty()) {
        log_debug("no violations, report skipped");
        return DispatchOutcome::Skipped;
    }

    MailMessage message { sender, { recipient }, subject_, format_report(violations) };
    mailer_.send(message);

    log_info("report with " + std::to_string(violations.size()) +
             " violation(s) sent to " + recipient);
    return DispatchOutcome::Sent;
}

} // namespace sgaudit
