#pragma once

#include "sgaudit/types.hpp"
#include <functional>
#include <string>
#include <vector>

namespace sgaudit {

struct IngressRule {
    std::string name;
    std::string description;
    std::function<bool(const IpRange&)> matches;
};

/**
 * RuleCollector
 *
 * Walks security groups in input order (group, then inbound permission,
 * then source range) and emits one Violation for every range matched by
 * a registered rule. Results are neither sorted nor deduplicated.
 */
class RuleCollector {
public:
    void add_rule(IngressRule rule);

    AuditResult collect(const std::vector<SecurityGroup>& groups) const;

    std::size_t rule_count() const { return rules_.size(); }

private:
    std::vector<IngressRule> rules_;
};

// ── Built-in rules ───────────────────────────────────────────────────────────

/// Flags source ranges equal to 0.0.0.0/0.
IngressRule unrestricted_ipv4_ingress();

/// Returns a RuleCollector pre-loaded with the built-in rules.
RuleCollector default_rule_collector();

/// Runs the default collector over `groups`.
AuditResult find_violations(const std::vector<SecurityGroup>& groups);

} // namespace sgaudit
