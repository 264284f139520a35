#pragma once

#include <optional>
#include <string>
#include <vector>

namespace sgaudit {

/// Source range that admits traffic from any IPv4 address.
inline constexpr const char* kUnrestrictedCidr = "0.0.0.0/0";

/// Display name used for groups that carry no name.
inline constexpr const char* kUnnamedGroup = "Unnamed";

struct IpRange {
    std::string cidr;           // "10.0.0.0/8"
    std::string description;
};

struct InboundPermission {
    std::string          protocol = "-1";   // "-1" = all traffic, "tcp", "udp", "icmp"
    std::optional<int>   from_port;
    std::optional<int>   to_port;
    std::vector<IpRange> ip_ranges;
};

struct SecurityGroup {
    std::string                    id;
    std::optional<std::string>     name;
    std::vector<InboundPermission> inbound;

    std::string display_name() const { return name.value_or(kUnnamedGroup); }
};

struct Violation {
    std::string       group_id;
    std::string       group_name;
    std::string       cidr;
    std::string       rule_name;
    InboundPermission permission;
};

struct AuditResult {
    std::vector<Violation> violations;

    std::size_t count() const { return violations.size(); }
    bool clean() const { return violations.empty(); }
};

/// "all traffic", "tcp port 22", "tcp ports 8000-8080", "icmp".
std::string describe(const InboundPermission& permission);

/// One report line for a violation.
std::string describe(const Violation& violation);

} // namespace sgaudit
