#pragma once

#include "addonhub/common/Error.h"
#include "addonhub/common/noncopyable.h"
#include "addonhub/core/Addon.h"
#include "addonhub/core/AddonRegistry.h"

#include <cstdint>
#include <mutex>
#include <string>
#include <vector>

namespace addonhub {
namespace monitor {
class AuditLogger;
}

namespace core {

struct InstallOptions {
    // Defaults to the module's Name().
    std::string id;
    // Parse hooks and run Init right away (Installed -> Loaded).
    bool autoLoad{true};
    // Enable right after a successful load.
    bool enable{false};
};

struct AddonSummary {
    std::string id;
    std::string name;
    std::string version;
    std::string fingerprint;
    AddonState state{AddonState::kInstalled};
    std::string lastError;
    std::uint64_t installOrder{0};
    size_t hookCount{0};
    long long invocations{0};
    long long failures{0};
    int consecutiveFailures{0};
    int inFlight{0};
};

struct AddonStatus {
    AddonState state{AddonState::kUnloaded};
    std::string lastError;
    std::vector<std::string> errorHistory;
};

struct HookDescription {
    std::string addonId;
    std::string hookName;
    EventKind kind{EventKind::kRequest};
    int priority{0};
    bool shortCircuit{false};
    bool blocking{false};
    std::string rule;
};

// Drives addons through Installed -> Loaded -> Active/Disabled -> Unloaded (and Error),
// and is the only writer of the registry. Every call that changes the set of dispatchable
// hooks returns after the new snapshot is published.
class LifecycleManager : common::noncopyable {
public:
    explicit LifecycleManager(AddonRegistry* registry, monitor::AuditLogger* audit = nullptr);
    ~LifecycleManager();

    bool InstallAddon(AddonFactory code,
                      AddonConfig config,
                      const InstallOptions& opts,
                      std::string* outId,
                      common::Error* err);
    bool LoadAddon(const std::string& id, AddonState* outState, common::Error* err);
    bool EnableAddon(const std::string& id, common::Error* err);
    bool DisableAddon(const std::string& id, common::Error* err);
    bool UpgradeAddon(const std::string& id, AddonFactory newCode, common::Error* err);
    // Re-initializes the addon's current code with new settings and hook overrides.
    bool ReconfigureAddon(const std::string& id, AddonConfig config, common::Error* err);
    bool UninstallAddon(const std::string& id, common::Error* err);

    std::vector<AddonSummary> ListAddons() const;
    bool GetAddonState(const std::string& id, AddonStatus* out, common::Error* err) const;
    // Every published hook in dispatch order, grouped by event kind.
    std::vector<HookDescription> DescribeHooks() const;

    // Moves an Active addon to Error on behalf of the dispatcher. Never blocks: when a
    // management call holds the lock the request is queued and applied by the next call.
    // Ignored when the addon is no longer Active or `instanceSerial` is not its current instance.
    void Quarantine(const std::string& id, std::uint64_t instanceSerial, const std::string& reason);
    size_t PendingQuarantines() const;

    // Uninstalls every addon.
    void Shutdown();

    const AddonRegistry& registry() const { return *registry_; }

    // Merges code declarations with configured overrides and parses every rule.
    static bool ResolveHooks(const std::vector<HookDeclaration>& declared,
                             const AddonConfig& config,
                             std::vector<HookDeclaration>* resolved,
                             std::vector<std::shared_ptr<const HookRule>>* rules,
                             common::Error* err);

private:
    struct PendingQuarantine {
        std::string id;
        std::uint64_t serial{0};
        std::string reason;
    };

    bool LoadLocked(AddonRecord* rec, common::Error* err);
    bool EnableLocked(AddonRecord* rec, common::Error* err);
    bool SwapCodeLocked(AddonRecord* rec,
                        std::unique_ptr<AddonModule> module,
                        AddonFactory factory,
                        AddonConfig config,
                        common::Error* err);
    bool PublishLocked(const std::string& id, std::vector<HookEntry> entries, common::Error* err);
    std::vector<HookEntry> EntriesFor(const AddonRecord& rec) const;
    void TransitionLocked(AddonRecord* rec, AddonState to, const std::string& reason);
    void FailLocked(AddonRecord* rec, const std::string& reason);
    void ApplyQuarantineLocked(const PendingQuarantine& q);
    void DrainQuarantinesLocked();

    AddonRegistry* registry_;
    monitor::AuditLogger* audit_;
    mutable std::mutex mutex_;

    mutable std::mutex pendingMutex_;
    std::vector<PendingQuarantine> pending_;
};

} // namespace core
} // namespace addonhub
