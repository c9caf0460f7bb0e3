#include "addonhub/addons/BuiltinAddons.h"

namespace addonhub {
namespace addons {

std::vector<core::HookDeclaration> HeaderInjector::Hooks() const {
    core::HookDeclaration req;
    req.name = "request";
    req.kind = core::EventKind::kRequestHeaders;
    core::HookDeclaration resp;
    resp.name = "response";
    resp.kind = core::EventKind::kResponseHeaders;
    return {req, resp};
}

bool HeaderInjector::Init(const core::AddonSettings& settings, std::string* error) {
    request_.clear();
    response_.clear();
    for (const auto& kv : settings) {
        const std::string& key = kv.first;
        if (key.compare(0, 8, "request.") == 0 && key.size() > 8) {
            core::SetHeader(&request_, key.substr(8), kv.second);
        } else if (key.compare(0, 9, "response.") == 0 && key.size() > 9) {
            core::SetHeader(&response_, key.substr(9), kv.second);
        } else {
            if (error) *error = "unknown setting '" + key + "'";
            return false;
        }
    }
    return true;
}

bool HeaderInjector::Handle(const std::string& hook, const core::TrafficEvent& event, core::Contribution* out,
                            std::string* error) {
    (void)event;
    if (hook == "request") {
        out->setHeaders = request_;
    } else if (hook == "response") {
        out->setHeaders = response_;
    } else {
        if (error) *error = "unknown hook '" + hook + "'";
        return false;
    }
    return true;
}

} // namespace addons
} // namespace addonhub
