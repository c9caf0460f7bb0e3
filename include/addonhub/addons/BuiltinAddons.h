#pragma once

#include "addonhub/core/Addon.h"

#include <map>
#include <string>
#include <vector>

namespace addonhub {
namespace addons {

// Sets fixed headers on requests and responses.
//   request.<Header> = value
//   response.<Header> = value
class HeaderInjector : public core::AddonModule {
public:
    std::string Name() const override { return "header_injector"; }
    std::string Version() const override { return "1.0"; }
    std::vector<core::HookDeclaration> Hooks() const override;
    bool Init(const core::AddonSettings& settings, std::string* error) override;
    bool Handle(const std::string& hook, const core::TrafficEvent& event, core::Contribution* out,
                std::string* error) override;

private:
    core::HeaderList request_;
    core::HeaderList response_;
};

// Answers requests to listed hosts with an error response and stops the cycle.
//   hosts  = ads.example.com, +.tracker.net   (domain wildcard syntax)
//   status = 403
//   reason = blocked by policy
class Blocklist : public core::AddonModule {
public:
    std::string Name() const override { return "blocklist"; }
    std::string Version() const override { return "1.0"; }
    std::vector<core::HookDeclaration> Hooks() const override;
    bool Init(const core::AddonSettings& settings, std::string* error) override;
    bool Handle(const std::string& hook, const core::TrafficEvent& event, core::Contribution* out,
                std::string* error) override;

private:
    std::vector<std::string> hosts_;
    int status_{403};
    std::string reason_{"blocked by policy"};
};

// Built-in factories by name, for `builtin = <name>` in configuration.
std::map<std::string, core::AddonFactory> BuiltinFactories();

} // namespace addons
} // namespace addonhub
