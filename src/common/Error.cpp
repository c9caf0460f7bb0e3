#include "addonhub/common/Error.h"

namespace addonhub {
namespace common {

const char* ErrorCodeName(ErrorCode code) {
    switch (code) {
        case ErrorCode::kOk: return "ok";
        case ErrorCode::kInvalidArgument: return "invalid_argument";
        case ErrorCode::kNotFound: return "not_found";
        case ErrorCode::kInvalidRule: return "invalid_rule";
        case ErrorCode::kLifecycleConflict: return "lifecycle_conflict";
        case ErrorCode::kAddonInitFailure: return "addon_init_failure";
        case ErrorCode::kAddonRuntimeFailure: return "addon_runtime_failure";
        case ErrorCode::kRegistryConsistencyFailure: return "registry_consistency_failure";
    }
    return "unknown";
}

void Error::Clear() {
    code = ErrorCode::kOk;
    field.clear();
    message.clear();
}

std::string Error::ToString() const {
    std::string out = ErrorCodeName(code);
    if (!field.empty()) out += " [" + field + "]";
    if (!message.empty()) out += ": " + message;
    return out;
}

bool Fail(Error* err, ErrorCode code, const std::string& message, const std::string& field) {
    if (err) {
        err->code = code;
        err->field = field;
        err->message = message;
    }
    return false;
}

} // namespace common
} // namespace addonhub
