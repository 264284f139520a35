#pragma once

#include "sgaudit/audit.hpp"
#include "sgaudit/types.hpp"

#include <cstdio>
#include <sstream>
#include <string>

namespace sgaudit {

namespace json_detail {

inline std::string escape(const std::string& s) {
    std::string result;
    result.reserve(s.size());
    for (char c : s) {
        switch (c) {
            case '"':  result += "\\\""; break;
            case '\\': result += "\\\\"; break;
            case '\n': result += "\\n";  break;
            case '\r': result += "\\r";  break;
            case '\t': result += "\\t";  break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned char>(c));
                    result += buf;
                } else {
                    result += c;
                }
                break;
        }
    }
    return result;
}

inline std::string quoted(const std::string& s) {
    return "\"" + escape(s) + "\"";
}

inline std::string outcome_str(DispatchOutcome o) {
    return o == DispatchOutcome::Sent ? "Sent" : "Skipped";
}

} // namespace json_detail

inline std::string to_json(const Violation& v) {
    std::ostringstream os;
    os << "{ \"group_id\": "   << json_detail::quoted(v.group_id)
       << ", \"group_name\": " << json_detail::quoted(v.group_name)
       << ", \"cidr\": "       << json_detail::quoted(v.cidr)
       << ", \"rule\": "       << json_detail::quoted(v.rule_name)
       << ", \"permission\": " << json_detail::quoted(describe(v.permission))
       << " }";
    return os.str();
}

inline std::string to_json(const AuditResult& result) {
    std::ostringstream os;
    os << "{\n"
       << "  \"count\": " << result.count() << ",\n"
       << "  \"violations\": [";
    for (std::size_t i = 0; i < result.violations.size(); ++i) {
        os << "\n    " << to_json(result.violations[i]);
        if (i + 1 < result.violations.size()) os << ",";
    }
    os << "\n  ]\n"
       << "}";
    return os.str();
}

/// Invocation response consumed by the trigger layer.
inline std::string to_json(const AuditResponse& response) {
    std::ostringstream os;
    const auto& violations = response.result.violations;
    os << "{\n"
       << "  \"statusCode\": " << response.status_code << ",\n"
       << "  \"body\": "       << json_detail::quoted(response.body) << ",\n"
       << "  \"report\": "     << json_detail::quoted(json_detail::outcome_str(response.dispatch)) << ",\n"
       << "  \"violations\": [";
    for (std::size_t i = 0; i < violations.size(); ++i) {
        os << "\n    " << to_json(violations[i]);
        if (i + 1 < violations.size()) os << ",";
    }
    os << "\n  ]\n"
       << "}";
    return os.str();
}

} // namespace sgaudit
