#include "sgaudit/group_source.hpp"
#include "sgaudit/errors.hpp"
#include "sgaudit/log.hpp"

#include <boost/property_tree/json_parser.hpp>
#include <boost/property_tree/ptree.hpp>

#include <fstream>
#include <iostream>
#include <optional>

namespace pt = boost::property_tree;

namespace sgaudit {

namespace {

// PropertyTree reads JSON null as the text "null"; such a leaf counts as absent.
std::optional<std::string> scalar(const pt::ptree& node, const std::string& key) {
    auto child = node.get_child_optional(key);
    if (!child || !child->empty()) return std::nullopt;
    if (child->data() == "null") return std::nullopt;
    return child->data();
}

std::string scalar_or(const pt::ptree& node, const std::string& key, const std::string& def) {
    return scalar(node, key).value_or(def);
}

// Arrays are nodes with no value and only unnamed children.
bool is_array(const pt::ptree& node) {
    if (!node.data().empty()) return false;
    for (const auto& entry : node)
        if (!entry.first.empty()) return false;
    return true;
}

IpRange parse_range(const pt::ptree& node) {
    IpRange range;
    range.cidr        = scalar_or(node, "CidrIp", "");
    range.description = scalar_or(node, "Description", "");
    return range;
}

InboundPermission parse_permission(const pt::ptree& node) {
    InboundPermission permission;
    permission.protocol  = scalar_or(node, "IpProtocol", "-1");
    if (auto from = node.get_optional<int>("FromPort")) permission.from_port = *from;
    if (auto to = node.get_optional<int>("ToPort"))     permission.to_port = *to;

    if (auto ranges = node.get_child_optional("IpRanges")) {
        for (const auto& entry : *ranges)
            permission.ip_ranges.push_back(parse_range(entry.second));
    }
    return permission;
}

SecurityGroup parse_group(const pt::ptree& node, std::size_t index) {
    SecurityGroup group;
    group.id = scalar_or(node, "GroupId", "");
    if (group.id.empty()) {
        throw CollectionError("security group #" + std::to_string(index) + " has no GroupId");
    }
    group.name = scalar(node, "GroupName");

    if (auto permissions = node.get_child_optional("IpPermissions")) {
        for (const auto& entry : *permissions)
            group.inbound.push_back(parse_permission(entry.second));
    }
    return group;
}

} // namespace

std::vector<SecurityGroup> parse_security_groups(std::istream& in) {
    pt::ptree root;
    try {
        pt::read_json(in, root);
    } catch (const pt::json_parser_error& e) {
        throw CollectionError("malformed security group listing: " + e.message() +
                              " (line " + std::to_string(e.line()) + ")");
    }

    auto groups = root.get_child_optional("SecurityGroups");
    if (!groups) {
        throw CollectionError("security group listing has no SecurityGroups array");
    }
    if (!is_array(*groups)) {
        throw CollectionError("SecurityGroups in security group listing is not an array");
    }

    std::vector<SecurityGroup> result;
    result.reserve(groups->size());
    for (const auto& entry : *groups)
        result.push_back(parse_group(entry.second, result.size()));
    return result;
}

// ── JsonSecurityGroupSource ──────────────────────────────────────────────────

JsonSecurityGroupSource::JsonSecurityGroupSource(std::string path)
    : path_(std::move(path)) {}

std::vector<SecurityGroup> JsonSecurityGroupSource::list_security_groups() {
    if (path_ == "-") {
        log_debug("reading security groups from standard input");
        return parse_security_groups(std::cin);
    }

    std::ifstream in(path_);
    if (!in.is_open()) {
        throw CollectionError("cannot open security group listing " + path_);
    }
    log_debug("reading security groups from " + path_);
    return parse_security_groups(in);
}

} // namespace sgaudit
