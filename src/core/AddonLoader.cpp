#include "addonhub/core/AddonLoader.h"
#include "addonhub/common/Logger.h"
#include "addonhub/core/HookRule.h"
#include "addonhub/core/LifecycleManager.h"
#include "addonhub/core/SharedLibraryAddon.h"

#include <utility>

namespace addonhub {
namespace core {

using common::Error;
using common::ErrorCode;
using common::Fail;

namespace {

const char kSectionPrefix[] = "addon.";

bool ParseHookKey(const std::string& key, const std::string& value, AddonConfig* cfg, Error* err) {
    // hook.<name>.<attr>
    const size_t dot = key.rfind('.');
    if (dot == std::string::npos || dot <= 5) {
        return Fail(err, ErrorCode::kInvalidArgument, "expected hook.<name>.<attribute>", key);
    }
    const std::string name = key.substr(5, dot - 5);
    const std::string attr = key.substr(dot + 1);
    AddonConfig::HookOverride& o = cfg->hooks[name];

    if (attr == "event") {
        EventKind kind;
        if (!ParseEventKind(value, &kind)) {
            return Fail(err, ErrorCode::kInvalidRule, "unknown event kind '" + value + "'", key);
        }
        o.kind = kind;
    } else if (attr == "rule") {
        o.rule = value;
    } else if (attr == "priority") {
        long v = 0;
        if (!common::Config::ParseInt(value, &v)) {
            return Fail(err, ErrorCode::kInvalidArgument, "priority must be an integer", key);
        }
        o.priority = static_cast<int>(v);
    } else if (attr == "short_circuit" || attr == "blocking") {
        bool b = false;
        if (!common::Config::ParseBool(value, &b)) {
            return Fail(err, ErrorCode::kInvalidArgument, "expected a boolean", key);
        }
        if (attr == "blocking") {
            o.blocking = b;
        } else {
            o.shortCircuit = b;
        }
    } else {
        return Fail(err, ErrorCode::kInvalidArgument, "unknown hook attribute '" + attr + "'", key);
    }
    return true;
}

void Scope(const std::string& section, Error* err) {
    err->field = err->field.empty() ? "[" + section + "]" : "[" + section + "] " + err->field;
}

} // namespace

AddonLoader::AddonLoader(LifecycleManager* manager) : manager_(manager) {}

void AddonLoader::RegisterBuiltin(const std::string& name, AddonFactory factory) {
    builtins_[name] = std::move(factory);
}

bool AddonLoader::ParseSection(const std::string& id, const common::Config::Section& section, AddonSpec* out,
                               Error* err) {
    AddonSpec spec;
    spec.id = id;
    if (id.empty()) return Fail(err, ErrorCode::kInvalidArgument, "addon section without an id", kSectionPrefix);

    for (const auto& kv : section) {
        const std::string& key = kv.first;
        const std::string& value = kv.second;
        if (key == "path") {
            spec.path = value;
        } else if (key == "builtin") {
            spec.builtin = value;
        } else if (key == "sha256") {
            spec.sha256 = value;
        } else if (key == "enable") {
            if (!common::Config::ParseBool(value, &spec.enable)) {
                return Fail(err, ErrorCode::kInvalidArgument, "expected a boolean", key);
            }
        } else if (key.compare(0, 8, "setting.") == 0 && key.size() > 8) {
            spec.config.settings[key.substr(8)] = value;
        } else if (key.compare(0, 5, "hook.") == 0) {
            if (!ParseHookKey(key, value, &spec.config, err)) return false;
        } else {
            return Fail(err, ErrorCode::kInvalidArgument, "unknown key", key);
        }
    }

    if (spec.path.empty() == spec.builtin.empty()) {
        return Fail(err, ErrorCode::kInvalidArgument, "exactly one of 'path' or 'builtin' is required", "path");
    }
    if (!spec.sha256.empty() && spec.path.empty()) {
        return Fail(err, ErrorCode::kInvalidArgument, "sha256 applies to shared-library addons only", "sha256");
    }
    *out = std::move(spec);
    return true;
}

bool AddonLoader::FactoryFor(const AddonSpec& spec, AddonFactory* out, Error* err) const {
    if (!spec.path.empty()) {
        *out = SharedLibraryAddon::Factory(spec.path, spec.sha256);
        return true;
    }
    auto it = builtins_.find(spec.builtin);
    if (it == builtins_.end()) {
        return Fail(err, ErrorCode::kNotFound, "no built-in addon named '" + spec.builtin + "'", "builtin");
    }
    *out = it->second;
    return true;
}

bool AddonLoader::Install(const AddonSpec& spec, Error* err) {
    AddonFactory factory;
    if (!FactoryFor(spec, &factory, err)) return false;
    InstallOptions opts;
    opts.id = spec.id;
    opts.autoLoad = true;
    opts.enable = spec.enable;
    std::string id;
    return manager_->InstallAddon(std::move(factory), spec.config, opts, &id, err);
}

size_t AddonLoader::InstallFromConfig(const common::Config& conf, std::vector<Error>* errors) {
    size_t installed = 0;
    for (const auto& sec : conf.GetSectionsWithPrefix(kSectionPrefix)) {
        const std::string id = sec.first.substr(sizeof(kSectionPrefix) - 1);
        AddonSpec spec;
        Error err;
        if (!ParseSection(id, sec.second, &spec, &err) || !Install(spec, &err)) {
            Scope(sec.first, &err);
            LOG_ERROR << "Addon " << id << " not installed: " << err.ToString();
            if (errors) errors->push_back(err);
            continue;
        }
        ++installed;
    }
    return installed;
}

bool AddonLoader::CheckConfig(const common::Config& conf, std::vector<Error>* errors) {
    bool ok = true;
    for (const auto& sec : conf.GetSectionsWithPrefix(kSectionPrefix)) {
        const std::string id = sec.first.substr(sizeof(kSectionPrefix) - 1);
        AddonSpec spec;
        Error err;
        bool good = ParseSection(id, sec.second, &spec, &err);
        if (good) {
            // Override rules parse on their own; rules declared by code are checked at load.
            for (const auto& h : spec.config.hooks) {
                if (!h.second.rule) continue;
                HookRule rule;
                if (!RuleParser::BuildRule(h.second.kind.value_or(EventKind::kRequest), *h.second.rule, 0, false,
                                           &rule, &err, "hook." + h.first + ".rule")) {
                    good = false;
                    break;
                }
            }
        }
        if (!good) {
            ok = false;
            Scope(sec.first, &err);
            if (errors) errors->push_back(err);
        }
    }
    return ok;
}

} // namespace core
} // namespace addonhub
