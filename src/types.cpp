#include "sgaudit/types.hpp"

#include <sstream>

namespace sgaudit {

std::string describe(const InboundPermission& permission) {
    if (permission.protocol == "-1" || permission.protocol == "all")
        return "all traffic";

    std::ostringstream os;
    os << permission.protocol;
    if (!permission.from_port || permission.protocol == "icmp" || permission.protocol == "icmpv6")
        return os.str();

    int from = *permission.from_port;
    int to   = permission.to_port.value_or(from);
    if (from == to) {
        os << " port " << from;
    } else {
        os << " ports " << from << "-" << to;
    }
    return os.str();
}

std::string describe(const Violation& violation) {
    std::ostringstream os;
    os << "Security Group '" << violation.group_name << "' (" << violation.group_id
       << ") allows inbound access from " << violation.cidr
       << ". Rule: " << describe(violation.permission);
    return os.str();
}

} // namespace sgaudit
