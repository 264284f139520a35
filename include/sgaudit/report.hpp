#pragma once

#include "sgaudit/mail.hpp"
#include "sgaudit/types.hpp"
#include <ostream>
#include <string>
#include <vector>

namespace sgaudit {

inline constexpr const char* kReportHeader  = "Security Group Audit Report:";
inline constexpr const char* kReportSubject = "Security Group Audit Alert";

enum class DispatchOutcome { Sent, Skipped };

inline std::ostream& operator<<(std::ostream& os, DispatchOutcome o) {
    return os << (o == DispatchOutcome::Sent ? "Sent" : "Skipped");
}

/// Header line, blank line, then one line per violation in input order.
std::string format_report(const std::vector<Violation>& violations);

/**
 * ReportDispatcher
 *
 * Turns a list of violations into a single email. An empty list is a
 * normal early return (Skipped) and never reaches the mail sender.
 * DispatchError from the sender is propagated as-is.
 */
class ReportDispatcher {
public:
    explicit ReportDispatcher(MailSender& mailer, std::string subject = kReportSubject);

    DispatchOutcome send_report(const std::vector<Violation>& violations,
                                const std::string& sender,
                                const std::string& recipient) const;

private:
    MailSender& mailer_;
    std::string subject_;
};

} // namespace sgaudit
