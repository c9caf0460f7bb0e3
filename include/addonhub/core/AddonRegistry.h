#pragma once

#include "addonhub/common/Error.h"
#include "addonhub/common/noncopyable.h"
#include "addonhub/core/Addon.h"
#include "addonhub/core/HookRule.h"

#include <array>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <deque>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace addonhub {
namespace core {

// One dispatchable hook inside a snapshot.
struct HookEntry {
    std::string addonId;
    std::string hookName;
    std::uint64_t installOrder{0};
    size_t declIndex{0};
    bool blocking{false};
    std::shared_ptr<const HookRule> rule;
    std::shared_ptr<AddonInstance> instance;
};

// Immutable view of every Active addon's hooks, grouped by event kind and kept in
// dispatch order: priority, then install order, then declaration order.
class RegistrySnapshot {
public:
    static std::shared_ptr<const RegistrySnapshot> Empty();

    std::uint64_t generation() const { return generation_; }
    const std::vector<HookEntry>& HooksFor(EventKind kind) const { return byKind_[EventKindIndex(kind)]; }
    size_t HookCount() const;
    bool Contains(const std::string& addonId) const;
    std::vector<std::string> AddonIds() const;

    // Copy of this snapshot with `addonId`'s hooks replaced by `entries`
    // (an empty vector removes the addon). Generation is bumped by one.
    std::shared_ptr<const RegistrySnapshot> WithAddon(const std::string& addonId, std::vector<HookEntry> entries) const;

private:
    RegistrySnapshot() = default;

    std::uint64_t generation_{0};
    std::array<std::vector<HookEntry>, kEventKindCount> byKind_;
};

// Everything the lifecycle manager knows about one installed addon.
struct AddonRecord {
    std::string id;
    std::string name;
    std::string version;
    std::string fingerprint;
    AddonState state{AddonState::kInstalled};
    std::uint64_t installOrder{0};

    AddonFactory factory;
    AddonConfig config;
    // Module produced at install time, consumed by the first load.
    std::unique_ptr<AddonModule> pendingModule;

    std::vector<HookDeclaration> declarations;
    std::vector<std::shared_ptr<const HookRule>> rules;  // parallel to declarations
    std::shared_ptr<AddonInstance> instance;

    std::string lastError;
    std::deque<std::string> errorHistory;
    std::chrono::system_clock::time_point installedAt;
    std::chrono::system_clock::time_point stateChangedAt;
};

// Holds the addon records and the current snapshot pointer.
// Records are only touched by LifecycleManager under its lock; the snapshot pointer is
// read lock-free by dispatchers and swapped atomically by Publish.
class AddonRegistry : common::noncopyable {
public:
    static constexpr size_t kMaxErrorHistory = 16;

    AddonRegistry();

    std::shared_ptr<const RegistrySnapshot> Current() const;

    // Verifies `next` against the records and swaps it in. On a consistency failure the
    // registry is marked corrupted, the current snapshot is left in place and false is returned.
    bool Publish(std::shared_ptr<const RegistrySnapshot> next, common::Error* err);

    bool corrupted() const { return corrupted_.load(std::memory_order_acquire); }

    AddonRecord* Find(const std::string& id);
    const AddonRecord* Find(const std::string& id) const;
    AddonRecord* Insert(AddonRecord record);
    void Erase(const std::string& id);
    // Records in install order.
    std::vector<const AddonRecord*> Records() const;
    size_t size() const { return records_.size(); }

    std::uint64_t NextInstallOrder() { return ++installSeq_; }
    std::uint64_t NextInstanceSerial() { return ++instanceSeq_; }

    bool VerifyConsistency(const RegistrySnapshot& snap, common::Error* err) const;

private:
    // Accessed through std::atomic_load / std::atomic_store only.
    std::shared_ptr<const RegistrySnapshot> current_;
    std::map<std::string, AddonRecord> records_;
    std::atomic<bool> corrupted_{false};
    std::uint64_t installSeq_{0};
    std::uint64_t instanceSeq_{0};
};

} // namespace core
} // namespace addonhub
