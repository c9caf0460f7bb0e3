#include "addonhub/core/LifecycleManager.h"
#include "addonhub/common/Logger.h"
#include "addonhub/core/RuleMatcher.h"
#include "addonhub/monitor/AuditLogger.h"

#include <algorithm>
#include <exception>
#include <set>
#include <utility>

namespace addonhub {
namespace core {

using common::Error;
using common::ErrorCode;
using common::Fail;

static bool CreateModule(const AddonFactory& code, std::unique_ptr<AddonModule>* out, Error* err) {
    if (!code) return Fail(err, ErrorCode::kInvalidArgument, "no addon code", "code");
    std::string why;
    try {
        *out = code(&why);
    } catch (const std::exception& e) {
        out->reset();
        why = std::string("addon code threw: ") + e.what();
    }
    if (!*out) {
        return Fail(err, ErrorCode::kAddonInitFailure, why.empty() ? "addon code produced no module" : why, "code");
    }
    return true;
}

static bool DeclaredHooks(AddonModule& module, std::vector<HookDeclaration>* out, Error* err) {
    try {
        *out = module.Hooks();
    } catch (const std::exception& e) {
        return Fail(err, ErrorCode::kAddonInitFailure, std::string("hook declaration threw: ") + e.what(), "hooks");
    }
    return true;
}

LifecycleManager::LifecycleManager(AddonRegistry* registry, monitor::AuditLogger* audit)
    : registry_(registry), audit_(audit) {}

LifecycleManager::~LifecycleManager() {
    Shutdown();
}

bool LifecycleManager::ResolveHooks(const std::vector<HookDeclaration>& declared,
                                    const AddonConfig& config,
                                    std::vector<HookDeclaration>* resolved,
                                    std::vector<std::shared_ptr<const HookRule>>* rules,
                                    Error* err) {
    std::vector<HookDeclaration> hooks;
    std::set<std::string> names;
    for (const auto& d : declared) {
        if (d.name.empty()) return Fail(err, ErrorCode::kInvalidRule, "hook without a name", "hook");
        if (!names.insert(d.name).second) {
            return Fail(err, ErrorCode::kInvalidRule, "duplicate hook name", "hook." + d.name);
        }
        hooks.push_back(d);
    }

    for (const auto& kv : config.hooks) {
        const std::string& name = kv.first;
        const AddonConfig::HookOverride& o = kv.second;
        auto it = std::find_if(hooks.begin(), hooks.end(), [&](const HookDeclaration& d) { return d.name == name; });
        if (it == hooks.end()) {
            if (!o.kind) {
                return Fail(err, ErrorCode::kInvalidRule, "hook not declared by the addon and no event given",
                            "hook." + name + ".event");
            }
            HookDeclaration d;
            d.name = name;
            hooks.push_back(d);
            it = hooks.end() - 1;
        }
        if (o.kind) it->kind = *o.kind;
        if (o.rule) it->rule = *o.rule;
        if (o.priority) it->priority = *o.priority;
        if (o.shortCircuit) it->shortCircuit = *o.shortCircuit;
        if (o.blocking) it->blocking = *o.blocking;
    }

    std::vector<std::shared_ptr<const HookRule>> parsed;
    parsed.reserve(hooks.size());
    for (const auto& d : hooks) {
        const std::string field = "hook." + d.name + ".rule";
        HookRule rule;
        if (!RuleParser::BuildRule(d.kind, d.rule, d.priority, d.shortCircuit, &rule, err, field)) return false;
        if (!RuleMatcher::Validate(rule, err, field)) return false;
        parsed.push_back(std::make_shared<const HookRule>(std::move(rule)));
    }

    if (resolved) *resolved = std::move(hooks);
    if (rules) *rules = std::move(parsed);
    return true;
}

std::vector<HookEntry> LifecycleManager::EntriesFor(const AddonRecord& rec) const {
    std::vector<HookEntry> entries;
    entries.reserve(rec.declarations.size());
    for (size_t i = 0; i < rec.declarations.size() && i < rec.rules.size(); ++i) {
        HookEntry e;
        e.addonId = rec.id;
        e.hookName = rec.declarations[i].name;
        e.installOrder = rec.installOrder;
        e.declIndex = i;
        e.blocking = rec.declarations[i].blocking;
        e.rule = rec.rules[i];
        e.instance = rec.instance;
        entries.push_back(std::move(e));
    }
    return entries;
}

bool LifecycleManager::PublishLocked(const std::string& id, std::vector<HookEntry> entries, Error* err) {
    const auto next = registry_->Current()->WithAddon(id, std::move(entries));
    if (!registry_->Publish(next, err)) return false;
    LOG_DEBUG << "Registry snapshot published: generation=" << next->generation() << " hooks=" << next->HookCount();
    return true;
}

void LifecycleManager::TransitionLocked(AddonRecord* rec, AddonState to, const std::string& reason) {
    const AddonState from = rec->state;
    rec->state = to;
    rec->stateChangedAt = std::chrono::system_clock::now();
    if (reason.empty()) {
        LOG_INFO << "Addon " << rec->id << ": " << AddonStateName(from) << " -> " << AddonStateName(to);
    } else {
        LOG_INFO << "Addon " << rec->id << ": " << AddonStateName(from) << " -> " << AddonStateName(to) << " ("
                 << reason << ")";
    }
    if (audit_) audit_->RecordTransition(rec->id, AddonStateName(from), AddonStateName(to), reason);
}

void LifecycleManager::FailLocked(AddonRecord* rec, const std::string& reason) {
    const AddonState from = rec->state;
    if (registry_->Current()->Contains(rec->id)) {
        rec->state = AddonState::kError;
        Error e;
        if (!PublishLocked(rec->id, {}, &e)) {
            LOG_ERROR << "Failed to withdraw hooks of " << rec->id << ": " << e.ToString();
        }
        rec->state = from;
    }
    TransitionLocked(rec, AddonState::kError, reason);
    rec->lastError = reason;
    rec->errorHistory.push_back(reason);
    while (rec->errorHistory.size() > AddonRegistry::kMaxErrorHistory) rec->errorHistory.pop_front();
    rec->instance.reset();
    LOG_ERROR << "Addon " << rec->id << " failed: " << reason;
}

bool LifecycleManager::LoadLocked(AddonRecord* rec, Error* err) {
    std::unique_ptr<AddonModule> module = std::move(rec->pendingModule);
    if (!module && !CreateModule(rec->factory, &module, err)) return false;

    std::vector<HookDeclaration> declared;
    std::vector<HookDeclaration> resolved;
    std::vector<std::shared_ptr<const HookRule>> rules;
    if (!DeclaredHooks(*module, &declared, err) || !ResolveHooks(declared, rec->config, &resolved, &rules, err)) {
        rec->pendingModule = std::move(module);
        return false;
    }

    auto inst = std::make_shared<AddonInstance>(rec->id, registry_->NextInstanceSerial(), std::move(module));
    std::string why;
    if (!inst->Init(rec->config.settings, &why)) {
        FailLocked(rec, "init failed: " + why);
        return Fail(err, ErrorCode::kAddonInitFailure, why, "init");
    }
    rec->declarations = std::move(resolved);
    rec->rules = std::move(rules);
    rec->instance = std::move(inst);
    TransitionLocked(rec, AddonState::kLoaded, std::string());
    return true;
}

bool LifecycleManager::EnableLocked(AddonRecord* rec, Error* err) {
    if (rec->state != AddonState::kLoaded && rec->state != AddonState::kDisabled) {
        return Fail(err, ErrorCode::kLifecycleConflict,
                    std::string("cannot enable from state ") + AddonStateName(rec->state), rec->id);
    }
    const AddonState from = rec->state;
    rec->state = AddonState::kActive;
    if (!PublishLocked(rec->id, EntriesFor(*rec), err)) {
        rec->state = from;
        return false;
    }
    rec->state = from;
    TransitionLocked(rec, AddonState::kActive, std::string());
    return true;
}

bool LifecycleManager::InstallAddon(AddonFactory code,
                                    AddonConfig config,
                                    const InstallOptions& opts,
                                    std::string* outId,
                                    Error* err) {
    std::unique_ptr<AddonModule> module;
    if (!CreateModule(code, &module, err)) return false;

    const std::string id = opts.id.empty() ? module->Name() : opts.id;
    if (id.empty()) return Fail(err, ErrorCode::kInvalidArgument, "addon id is empty", "id");

    std::vector<HookDeclaration> declared;
    if (!DeclaredHooks(*module, &declared, err)) return false;
    if (!ResolveHooks(declared, config, nullptr, nullptr, err)) {
        LOG_WARN << "Addon " << id << " rejected: " << (err ? err->ToString() : std::string("invalid hooks"));
        return false;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    DrainQuarantinesLocked();

    if (const AddonRecord* existing = registry_->Find(id)) {
        if (existing->state != AddonState::kError) {
            return Fail(err, ErrorCode::kLifecycleConflict,
                        std::string("addon already installed in state ") + AddonStateName(existing->state), id);
        }
        LOG_INFO << "Re-installing failed addon " << id;
        registry_->Erase(id);
    }

    AddonRecord rec;
    rec.id = id;
    rec.name = module->Name();
    rec.version = module->Version();
    rec.fingerprint = module->Fingerprint();
    rec.state = AddonState::kInstalled;
    rec.installOrder = registry_->NextInstallOrder();
    rec.factory = std::move(code);
    rec.config = std::move(config);
    rec.pendingModule = std::move(module);
    rec.installedAt = std::chrono::system_clock::now();
    rec.stateChangedAt = rec.installedAt;
    AddonRecord* r = registry_->Insert(std::move(rec));
    LOG_INFO << "Addon " << id << " installed: name=" << r->name << " version=" << r->version
             << " order=" << r->installOrder;
    if (audit_) audit_->RecordTransition(id, "none", AddonStateName(AddonState::kInstalled), "version " + r->version);
    if (outId) *outId = id;

    if (!opts.autoLoad) return true;
    if (!LoadLocked(r, err)) return false;
    if (!opts.enable) return true;
    return EnableLocked(r, err);
}

bool LifecycleManager::LoadAddon(const std::string& id, AddonState* outState, Error* err) {
    std::lock_guard<std::mutex> lock(mutex_);
    DrainQuarantinesLocked();
    AddonRecord* rec = registry_->Find(id);
    if (!rec) return Fail(err, ErrorCode::kNotFound, "no such addon", id);
    if (rec->state != AddonState::kInstalled) {
        return Fail(err, ErrorCode::kLifecycleConflict,
                    std::string("cannot load from state ") + AddonStateName(rec->state), id);
    }
    const bool ok = LoadLocked(rec, err);
    if (outState) *outState = rec->state;
    return ok;
}

bool LifecycleManager::EnableAddon(const std::string& id, Error* err) {
    std::lock_guard<std::mutex> lock(mutex_);
    DrainQuarantinesLocked();
    AddonRecord* rec = registry_->Find(id);
    if (!rec) return Fail(err, ErrorCode::kNotFound, "no such addon", id);
    return EnableLocked(rec, err);
}

bool LifecycleManager::DisableAddon(const std::string& id, Error* err) {
    std::lock_guard<std::mutex> lock(mutex_);
    DrainQuarantinesLocked();
    AddonRecord* rec = registry_->Find(id);
    if (!rec) return Fail(err, ErrorCode::kNotFound, "no such addon", id);
    if (rec->state != AddonState::kActive) {
        return Fail(err, ErrorCode::kLifecycleConflict,
                    std::string("cannot disable from state ") + AddonStateName(rec->state), id);
    }
    rec->state = AddonState::kDisabled;
    if (!PublishLocked(rec->id, {}, err)) {
        rec->state = AddonState::kActive;
        return false;
    }
    rec->state = AddonState::kActive;
    TransitionLocked(rec, AddonState::kDisabled, std::string());
    return true;
}

bool LifecycleManager::SwapCodeLocked(AddonRecord* rec,
                                      std::unique_ptr<AddonModule> module,
                                      AddonFactory factory,
                                      AddonConfig config,
                                      Error* err) {
    const std::string provisional = rec->id + "@next";
    std::vector<HookDeclaration> declared;
    std::vector<HookDeclaration> resolved;
    std::vector<std::shared_ptr<const HookRule>> rules;
    if (!DeclaredHooks(*module, &declared, err) || !ResolveHooks(declared, config, &resolved, &rules, err)) {
        LOG_WARN << "Replacement for " << rec->id << " rejected: "
                 << (err ? err->ToString() : std::string("invalid hooks"));
        return false;
    }

    const std::string newName = module->Name();
    const std::string newVersion = module->Version();
    const std::string newFingerprint = module->Fingerprint();
    // Same addon id so log lines from the new instance attribute correctly once live.
    auto inst = std::make_shared<AddonInstance>(rec->id, registry_->NextInstanceSerial(), std::move(module));
    std::string why;
    if (!inst->Init(config.settings, &why)) {
        FailLocked(rec, "init of " + provisional + " failed: " + why);
        return Fail(err, ErrorCode::kAddonInitFailure, why, "init");
    }

    const std::string oldVersion = rec->version;
    AddonRecord previous;
    previous.name = std::move(rec->name);
    previous.version = std::move(rec->version);
    previous.fingerprint = std::move(rec->fingerprint);
    previous.factory = std::move(rec->factory);
    previous.config = std::move(rec->config);
    previous.declarations = std::move(rec->declarations);
    previous.rules = std::move(rec->rules);
    previous.instance = std::move(rec->instance);

    rec->name = newName;
    rec->version = newVersion;
    rec->fingerprint = newFingerprint;
    rec->factory = std::move(factory);
    rec->config = std::move(config);
    rec->declarations = std::move(resolved);
    rec->rules = std::move(rules);
    rec->instance = std::move(inst);

    if (rec->state == AddonState::kActive) {
        // One publish replaces the whole hook set of the addon.
        if (!PublishLocked(rec->id, EntriesFor(*rec), err)) {
            rec->name = std::move(previous.name);
            rec->version = std::move(previous.version);
            rec->fingerprint = std::move(previous.fingerprint);
            rec->factory = std::move(previous.factory);
            rec->config = std::move(previous.config);
            rec->declarations = std::move(previous.declarations);
            rec->rules = std::move(previous.rules);
            rec->instance = std::move(previous.instance);
            return false;
        }
    }

    LOG_INFO << "Addon " << rec->id << " swapped code: " << oldVersion << " -> " << rec->version
             << " hooks=" << rec->declarations.size();
    if (rec->state == AddonState::kError) {
        TransitionLocked(rec, AddonState::kLoaded, "upgraded to " + rec->version);
    } else if (audit_) {
        audit_->RecordTransition(rec->id, AddonStateName(rec->state), AddonStateName(rec->state),
                                 "upgraded " + oldVersion + " -> " + rec->version);
    }
    return true;
}

bool LifecycleManager::UpgradeAddon(const std::string& id, AddonFactory newCode, Error* err) {
    std::unique_ptr<AddonModule> module;
    if (!CreateModule(newCode, &module, err)) {
        // The replacement code could not even be loaded; the addon is left untouched.
        return false;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    DrainQuarantinesLocked();
    AddonRecord* rec = registry_->Find(id);
    if (!rec) return Fail(err, ErrorCode::kNotFound, "no such addon", id);
    if (rec->state == AddonState::kInstalled || rec->state == AddonState::kUnloaded) {
        return Fail(err, ErrorCode::kLifecycleConflict,
                    std::string("cannot upgrade from state ") + AddonStateName(rec->state), id);
    }
    AddonConfig config = rec->config;
    return SwapCodeLocked(rec, std::move(module), std::move(newCode), std::move(config), err);
}

bool LifecycleManager::ReconfigureAddon(const std::string& id, AddonConfig config, Error* err) {
    std::lock_guard<std::mutex> lock(mutex_);
    DrainQuarantinesLocked();
    AddonRecord* rec = registry_->Find(id);
    if (!rec) return Fail(err, ErrorCode::kNotFound, "no such addon", id);
    if (rec->state == AddonState::kInstalled) {
        // Not initialized yet: the new configuration is simply picked up by the load.
        std::vector<HookDeclaration> declared;
        if (rec->pendingModule) {
            if (!DeclaredHooks(*rec->pendingModule, &declared, err)) return false;
            if (!ResolveHooks(declared, config, nullptr, nullptr, err)) return false;
        }
        rec->config = std::move(config);
        return true;
    }
    if (rec->state == AddonState::kUnloaded) {
        return Fail(err, ErrorCode::kLifecycleConflict, "cannot reconfigure an unloaded addon", id);
    }
    std::unique_ptr<AddonModule> module;
    if (!CreateModule(rec->factory, &module, err)) return false;
    AddonFactory factory = rec->factory;
    return SwapCodeLocked(rec, std::move(module), std::move(factory), std::move(config), err);
}

bool LifecycleManager::UninstallAddon(const std::string& id, Error* err) {
    std::lock_guard<std::mutex> lock(mutex_);
    DrainQuarantinesLocked();
    AddonRecord* rec = registry_->Find(id);
    if (!rec) return Fail(err, ErrorCode::kNotFound, "no such addon", id);

    if (registry_->Current()->Contains(id)) {
        const AddonState from = rec->state;
        rec->state = AddonState::kUnloaded;
        if (!PublishLocked(id, {}, err)) {
            rec->state = from;
            return false;
        }
        rec->state = from;
    }
    TransitionLocked(rec, AddonState::kUnloaded, std::string());

    std::shared_ptr<AddonInstance> inst = std::move(rec->instance);
    registry_->Erase(id);
    if (inst && inst.use_count() > 1) {
        LOG_INFO << "Addon " << id << " release deferred: in_flight=" << inst->inFlight();
    }
    return true;
}

std::vector<AddonSummary> LifecycleManager::ListAddons() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<AddonSummary> out;
    for (const AddonRecord* rec : registry_->Records()) {
        AddonSummary s;
        s.id = rec->id;
        s.name = rec->name;
        s.version = rec->version;
        s.fingerprint = rec->fingerprint;
        s.state = rec->state;
        s.lastError = rec->lastError;
        s.installOrder = rec->installOrder;
        s.hookCount = rec->declarations.size();
        if (rec->instance) {
            s.invocations = rec->instance->invocations();
            s.failures = rec->instance->failures().totalFailures();
            s.consecutiveFailures = rec->instance->failures().consecutive();
            s.inFlight = rec->instance->inFlight();
        }
        out.push_back(std::move(s));
    }
    return out;
}

bool LifecycleManager::GetAddonState(const std::string& id, AddonStatus* out, Error* err) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const AddonRecord* rec = registry_->Find(id);
    if (!rec) {
        if (out) *out = AddonStatus();
        return Fail(err, ErrorCode::kNotFound, "no such addon", id);
    }
    if (out) {
        out->state = rec->state;
        out->lastError = rec->state == AddonState::kError ? rec->lastError : std::string();
        out->errorHistory.assign(rec->errorHistory.begin(), rec->errorHistory.end());
    }
    return true;
}

std::vector<HookDescription> LifecycleManager::DescribeHooks() const {
    const auto snap = registry_->Current();
    std::vector<HookDescription> out;
    for (size_t k = 0; k < kEventKindCount; ++k) {
        for (const auto& e : snap->HooksFor(static_cast<EventKind>(k))) {
            HookDescription d;
            d.addonId = e.addonId;
            d.hookName = e.hookName;
            d.kind = e.rule->kind;
            d.priority = e.rule->priority;
            d.shortCircuit = e.rule->shortCircuit;
            d.blocking = e.blocking;
            d.rule = e.rule->expression.empty() ? "*" : e.rule->expression;
            out.push_back(std::move(d));
        }
    }
    return out;
}

void LifecycleManager::ApplyQuarantineLocked(const PendingQuarantine& q) {
    AddonRecord* rec = registry_->Find(q.id);
    if (!rec || rec->state != AddonState::kActive || !rec->instance || rec->instance->serial() != q.serial) {
        LOG_DEBUG << "Quarantine of " << q.id << " ignored (no longer the active instance)";
        return;
    }
    FailLocked(rec, "quarantined: " + q.reason);
}

void LifecycleManager::DrainQuarantinesLocked() {
    std::vector<PendingQuarantine> pending;
    {
        std::lock_guard<std::mutex> pl(pendingMutex_);
        pending.swap(pending_);
    }
    for (const auto& q : pending) ApplyQuarantineLocked(q);
}

void LifecycleManager::Quarantine(const std::string& id, std::uint64_t instanceSerial, const std::string& reason) {
    std::unique_lock<std::mutex> lock(mutex_, std::try_to_lock);
    if (!lock.owns_lock()) {
        std::lock_guard<std::mutex> pl(pendingMutex_);
        for (const auto& q : pending_) {
            if (q.id == id && q.serial == instanceSerial) return;
        }
        pending_.push_back(PendingQuarantine{id, instanceSerial, reason});
        LOG_WARN << "Quarantine of " << id << " queued behind a management call";
        return;
    }
    DrainQuarantinesLocked();
    ApplyQuarantineLocked(PendingQuarantine{id, instanceSerial, reason});
}

size_t LifecycleManager::PendingQuarantines() const {
    std::lock_guard<std::mutex> pl(pendingMutex_);
    return pending_.size();
}

void LifecycleManager::Shutdown() {
    std::vector<std::string> ids;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        {
            std::lock_guard<std::mutex> pl(pendingMutex_);
            pending_.clear();
        }
        for (const AddonRecord* rec : registry_->Records()) ids.push_back(rec->id);
    }
    std::reverse(ids.begin(), ids.end());
    for (const auto& id : ids) {
        Error err;
        if (!UninstallAddon(id, &err)) {
            LOG_ERROR << "Uninstall of " << id << " during shutdown failed: " << err.ToString();
        }
    }
}

} // namespace core
} // namespace addonhub
