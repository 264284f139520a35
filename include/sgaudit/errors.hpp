#pragma once

#include <stdexcept>
#include <string>

namespace sgaudit {

struct AuditError : std::runtime_error {
    using std::runtime_error::runtime_error;
};

/// Required settings are missing or invalid. Raised before any audit runs.
struct ConfigurationError : AuditError {
    using AuditError::AuditError;
};

/// The security-group listing could not be obtained.
struct CollectionError : AuditError {
    using AuditError::AuditError;
};

/// The report could not be handed to the mail transport.
struct DispatchError : AuditError {
    using AuditError::AuditError;
};

} // namespace sgaudit
