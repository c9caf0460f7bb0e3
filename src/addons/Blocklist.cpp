#include "addonhub/addons/BuiltinAddons.h"
#include "addonhub/common/Config.h"
#include "addonhub/core/RuleMatcher.h"

#include <sstream>

namespace addonhub {
namespace addons {

std::vector<core::HookDeclaration> Blocklist::Hooks() const {
    core::HookDeclaration d;
    d.name = "block";
    d.kind = core::EventKind::kRequestHeaders;
    d.priority = -100;
    d.shortCircuit = true;
    return {d};
}

bool Blocklist::Init(const core::AddonSettings& settings, std::string* error) {
    hosts_.clear();
    for (const auto& kv : settings) {
        if (kv.first == "hosts") {
            std::stringstream ss(kv.second);
            std::string item;
            while (std::getline(ss, item, ',')) {
                item = common::Config::Trim(item);
                if (!item.empty()) hosts_.push_back(item);
            }
        } else if (kv.first == "status") {
            long v = 0;
            if (!common::Config::ParseInt(kv.second, &v) || v < 100 || v > 599) {
                if (error) *error = "status must be an HTTP status code";
                return false;
            }
            status_ = static_cast<int>(v);
        } else if (kv.first == "reason") {
            reason_ = kv.second;
        } else {
            if (error) *error = "unknown setting '" + kv.first + "'";
            return false;
        }
    }
    return true;
}

bool Blocklist::Handle(const std::string& hook, const core::TrafficEvent& event, core::Contribution* out,
                       std::string* error) {
    (void)hook;
    (void)error;
    const std::string& host = event.attributes().host;
    for (const auto& pattern : hosts_) {
        if (core::RuleMatcher::MatchDomainWildcard(pattern, host)) {
            *out = core::Contribution::Block(status_, reason_);
            out->annotations.push_back("matched " + pattern);
            return true;
        }
    }
    return true;
}

std::map<std::string, core::AddonFactory> BuiltinFactories() {
    std::map<std::string, core::AddonFactory> f;
    f["header_injector"] = [](std::string*) -> std::unique_ptr<core::AddonModule> {
        return std::make_unique<HeaderInjector>();
    };
    f["blocklist"] = [](std::string*) -> std::unique_ptr<core::AddonModule> {
        return std::make_unique<Blocklist>();
    };
    return f;
}

} // namespace addons
} // namespace addonhub
