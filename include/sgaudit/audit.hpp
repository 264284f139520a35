#pragma once

#include "sgaudit/config.hpp"
#include "sgaudit/group_source.hpp"
#include "sgaudit/mail.hpp"
#include "sgaudit/report.hpp"
#include "sgaudit/types.hpp"
#include <string>

namespace sgaudit {

struct AuditResponse {
    int             status_code = 200;
    std::string     body;
    AuditResult     result;
    DispatchOutcome dispatch = DispatchOutcome::Skipped;
};

/// "Audit complete. N insecure rules found."
std::string audit_summary(std::size_t violation_count);

/**
 * AuditRunner
 *
 * One audit invocation: list groups, collect violations, email them when
 * there are any. Collaborators are borrowed and must outlive the runner.
 * CollectionError and DispatchError propagate to the caller.
 */
class AuditRunner {
public:
    AuditRunner(SecurityGroupSource& source, MailSender& mailer, AuditConfig config);

    AuditResponse run() const;

    const AuditConfig& config() const { return config_; }

private:
    SecurityGroupSource& source_;
    MailSender&          mailer_;
    AuditConfig          config_;
};

} // namespace sgaudit
