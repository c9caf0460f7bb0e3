#include "addonhub/core/AddonRegistry.h"
#include "addonhub/common/Logger.h"

#include <algorithm>
#include <set>
#include <utility>

namespace addonhub {
namespace core {

using common::Error;
using common::ErrorCode;
using common::Fail;

std::shared_ptr<const RegistrySnapshot> RegistrySnapshot::Empty() {
    return std::shared_ptr<const RegistrySnapshot>(new RegistrySnapshot());
}

size_t RegistrySnapshot::HookCount() const {
    size_t n = 0;
    for (const auto& v : byKind_) n += v.size();
    return n;
}

bool RegistrySnapshot::Contains(const std::string& addonId) const {
    for (const auto& v : byKind_) {
        for (const auto& e : v) {
            if (e.addonId == addonId) return true;
        }
    }
    return false;
}

std::vector<std::string> RegistrySnapshot::AddonIds() const {
    std::set<std::string> ids;
    for (const auto& v : byKind_) {
        for (const auto& e : v) ids.insert(e.addonId);
    }
    return std::vector<std::string>(ids.begin(), ids.end());
}

std::shared_ptr<const RegistrySnapshot> RegistrySnapshot::WithAddon(const std::string& addonId,
                                                                    std::vector<HookEntry> entries) const {
    std::shared_ptr<RegistrySnapshot> next(new RegistrySnapshot());
    next->generation_ = generation_ + 1;
    next->byKind_ = byKind_;
    for (auto& v : next->byKind_) {
        v.erase(std::remove_if(v.begin(), v.end(), [&](const HookEntry& e) { return e.addonId == addonId; }),
                v.end());
    }
    for (auto& e : entries) {
        if (!e.rule) continue;
        const size_t idx = EventKindIndex(e.rule->kind);
        if (idx >= kEventKindCount) continue;
        next->byKind_[idx].push_back(std::move(e));
    }
    for (auto& v : next->byKind_) {
        std::stable_sort(v.begin(), v.end(), [](const HookEntry& a, const HookEntry& b) {
            if (a.rule->priority != b.rule->priority) return a.rule->priority < b.rule->priority;
            if (a.installOrder != b.installOrder) return a.installOrder < b.installOrder;
            return a.declIndex < b.declIndex;
        });
    }
    return next;
}

AddonRegistry::AddonRegistry() : current_(RegistrySnapshot::Empty()) {}

std::shared_ptr<const RegistrySnapshot> AddonRegistry::Current() const {
    return std::atomic_load(&current_);
}

bool AddonRegistry::VerifyConsistency(const RegistrySnapshot& snap, Error* err) const {
    for (size_t k = 0; k < kEventKindCount; ++k) {
        const auto& hooks = snap.HooksFor(static_cast<EventKind>(k));
        for (size_t i = 0; i < hooks.size(); ++i) {
            const HookEntry& e = hooks[i];
            if (!e.rule || !e.instance) {
                return Fail(err, ErrorCode::kRegistryConsistencyFailure, "entry without rule or handler", e.addonId);
            }
            if (EventKindIndex(e.rule->kind) != k) {
                return Fail(err, ErrorCode::kRegistryConsistencyFailure, "entry filed under wrong event kind",
                            e.addonId);
            }
            const AddonRecord* rec = Find(e.addonId);
            if (!rec || rec->state != AddonState::kActive) {
                return Fail(err, ErrorCode::kRegistryConsistencyFailure, "entry for an addon that is not active",
                            e.addonId);
            }
            if (rec->instance != e.instance) {
                return Fail(err, ErrorCode::kRegistryConsistencyFailure, "entry references a stale instance",
                            e.addonId);
            }
            if (i > 0 && hooks[i - 1].rule->priority > e.rule->priority) {
                return Fail(err, ErrorCode::kRegistryConsistencyFailure, "entries out of priority order", e.addonId);
            }
        }
    }
    for (const auto& kv : records_) {
        if (kv.second.state == AddonState::kActive && !kv.second.declarations.empty() && !snap.Contains(kv.first)) {
            return Fail(err, ErrorCode::kRegistryConsistencyFailure, "active addon missing from snapshot", kv.first);
        }
    }
    return true;
}

bool AddonRegistry::Publish(std::shared_ptr<const RegistrySnapshot> next, Error* err) {
    if (!next) return Fail(err, ErrorCode::kRegistryConsistencyFailure, "null snapshot");
    const auto prev = Current();
    if (next->generation() <= prev->generation()) {
        corrupted_.store(true, std::memory_order_release);
        LOG_FATAL << "Registry snapshot generation went backwards: " << prev->generation() << " -> "
                  << next->generation();
        return Fail(err, ErrorCode::kRegistryConsistencyFailure, "snapshot generation not increasing");
    }
    Error why;
    if (!VerifyConsistency(*next, &why)) {
        corrupted_.store(true, std::memory_order_release);
        LOG_FATAL << "Registry consistency failure, dispatch disabled: " << why.ToString();
        if (err) *err = why;
        return false;
    }
    std::atomic_store(&current_, std::move(next));
    return true;
}

AddonRecord* AddonRegistry::Find(const std::string& id) {
    auto it = records_.find(id);
    return it == records_.end() ? nullptr : &it->second;
}

const AddonRecord* AddonRegistry::Find(const std::string& id) const {
    auto it = records_.find(id);
    return it == records_.end() ? nullptr : &it->second;
}

AddonRecord* AddonRegistry::Insert(AddonRecord record) {
    const std::string id = record.id;
    records_.erase(id);
    auto res = records_.emplace(id, std::move(record));
    return &res.first->second;
}

void AddonRegistry::Erase(const std::string& id) {
    records_.erase(id);
}

std::vector<const AddonRecord*> AddonRegistry::Records() const {
    std::vector<const AddonRecord*> out;
    out.reserve(records_.size());
    for (const auto& kv : records_) out.push_back(&kv.second);
    std::sort(out.begin(), out.end(),
              [](const AddonRecord* a, const AddonRecord* b) { return a->installOrder < b->installOrder; });
    return out;
}

} // namespace core
} // namespace addonhub
