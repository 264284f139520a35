#include "sgaudit/rule_collector.hpp"

namespace sgaudit {

// ── RuleCollector ────────────────────────────────────────────────────────────

void RuleCollector::add_rule(IngressRule rule) {
    rules_.push_back(std::move(rule));
}

AuditResult RuleCollector::collect(const std::vector<SecurityGroup>& groups) const {
    AuditResult result;

    for (const auto& group : groups) {
        const std::string name = group.display_name();
        for (const auto& permission : group.inbound) {
            for (const auto& range : permission.ip_ranges) {
                for (const auto& rule : rules_) {
                    if (rule.matches(range)) {
                        result.violations.push_back({ group.id, name, range.cidr,
                                                      rule.name, permission });
                    }
                }
            }
        }
    }
    return result;
}

// ── Built-in rules ───────────────────────────────────────────────────────────

IngressRule unrestricted_ipv4_ingress() {
    return {
        "UnrestrictedIpv4Ingress",
        "Inbound rule admits traffic from any IPv4 address (0.0.0.0/0).",
        [](const IpRange& range) {
            return range.cidr == kUnrestrictedCidr;
        }
    };
}

RuleCollector default_rule_collector() {
    RuleCollector collector;
    collector.add_rule(unrestricted_ipv4_ingress());
    return collector;
}

AuditResult find_violations(const std::vector<SecurityGroup>& groups) {
    return default_rule_collector().collect(groups);
}

} // namespace sgaudit
