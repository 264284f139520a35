#pragma once

#include "sgaudit/types.hpp"
#include <istream>
#include <string>
#include <vector>

namespace sgaudit {

/// Read-only listing of every security group. Throws CollectionError.
class SecurityGroupSource {
public:
    virtual ~SecurityGroupSource() = default;
    virtual std::vector<SecurityGroup> list_security_groups() = 0;
};

/**
 * JsonSecurityGroupSource
 *
 * Reads a DescribeSecurityGroups-shaped document from a file, or from
 * standard input when the path is "-". The document is read afresh on
 * every call.
 */
class JsonSecurityGroupSource : public SecurityGroupSource {
public:
    explicit JsonSecurityGroupSource(std::string path);

    std::vector<SecurityGroup> list_security_groups() override;

    const std::string& path() const { return path_; }

private:
    std::string path_;
};

/// Parses a DescribeSecurityGroups document. Throws CollectionError.
std::vector<SecurityGroup> parse_security_groups(std::istream& in);

} // namespace sgaudit
