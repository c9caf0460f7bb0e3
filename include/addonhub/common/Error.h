#pragma once

#include <string>

namespace addonhub {
namespace common {

enum class ErrorCode {
    kOk,
    kInvalidArgument,
    kNotFound,
    kInvalidRule,
    kLifecycleConflict,
    kAddonInitFailure,
    kAddonRuntimeFailure,
    kRegistryConsistencyFailure,
};

const char* ErrorCodeName(ErrorCode code);

// Filled through an out pointer by calls that return bool.
// `field` names the offending configuration key or rule clause when there is one.
struct Error {
    ErrorCode code{ErrorCode::kOk};
    std::string field;
    std::string message;

    bool ok() const { return code == ErrorCode::kOk; }
    void Clear();
    std::string ToString() const;
};

// Fills *err (if non-null) and returns false, so callers can write `return Fail(err, ...);`.
bool Fail(Error* err, ErrorCode code, const std::string& message, const std::string& field = std::string());

} // namespace common
} // namespace addonhub
