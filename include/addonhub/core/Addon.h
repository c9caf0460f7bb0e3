#pragma once

#include "addonhub/common/noncopyable.h"
#include "addonhub/core/TrafficEvent.h"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace addonhub {
namespace core {

enum class AddonState {
    kInstalled,
    kLoaded,
    kActive,
    kDisabled,
    kError,
    kUnloaded,
};

const char* AddonStateName(AddonState state);

using AddonSettings = std::map<std::string, std::string>;

// A hook as declared by addon code.
struct HookDeclaration {
    std::string name;
    EventKind kind{EventKind::kRequest};
    std::string rule;  // rule language or Clash line; empty => every event of `kind`
    int priority{0};
    bool shortCircuit{false};
    // Hooks that may block are run on the executor with a deadline.
    bool blocking{false};
};

// Per-install configuration. Hook overrides are keyed by hook name; unset fields keep
// the value declared by the code, and unknown names add a new hook (then `kind` is required).
struct AddonConfig {
    struct HookOverride {
        std::optional<EventKind> kind;
        std::optional<std::string> rule;
        std::optional<int> priority;
        std::optional<bool> shortCircuit;
        std::optional<bool> blocking;
    };

    AddonSettings settings;
    std::map<std::string, HookOverride> hooks;
};

// Capability interface every addon implements. The engine only talks to addons through it.
class AddonModule {
public:
    virtual ~AddonModule() = default;

    virtual std::string Name() const = 0;
    virtual std::string Version() const = 0;
    virtual std::vector<HookDeclaration> Hooks() const = 0;

    // Called once before the instance becomes dispatchable.
    virtual bool Init(const AddonSettings& settings, std::string* error) {
        (void)settings;
        (void)error;
        return true;
    }
    virtual void Shutdown() {}

    // Handle one matched event for `hook`. Return false and fill *error to report a failure.
    virtual bool Handle(const std::string& hook, const TrafficEvent& event, Contribution* out, std::string* error) = 0;

    // Content digest of the code, empty when not applicable.
    virtual std::string Fingerprint() const { return std::string(); }
};

// Produces a fresh module per install or upgrade. Returns nullptr and fills *error on failure.
using AddonFactory = std::function<std::unique_ptr<AddonModule>(std::string* error)>;

struct HookOutcome {
    // kExpired: the deadline passed before the hook started. Not the addon's fault.
    enum class Status { kOk, kFailed, kTimeout, kExpired };

    Status status{Status::kOk};
    Contribution contribution;
    std::string error;
    std::chrono::microseconds elapsed{0};

    bool ok() const { return status == Status::kOk; }
};

const char* HookOutcomeStatusName(HookOutcome::Status status);

// Streak of consecutive runtime failures. The threshold trips when `threshold`
// consecutive failures all fall inside `window`.
class FailureTracker {
public:
    using Clock = std::chrono::steady_clock;

    // Returns true when the threshold is reached (and on every failure while it stays reached).
    bool RecordFailureAt(Clock::time_point now, const std::string& reason, int threshold, Clock::duration window);
    void RecordSuccess();

    int consecutive() const;
    long long totalFailures() const { return totalFailures_.load(std::memory_order_relaxed); }
    std::string lastError() const;

private:
    mutable std::mutex mutex_;
    std::deque<Clock::time_point> streak_;
    std::string lastError_;
    std::atomic<int> consecutive_{0};
    std::atomic<long long> totalFailures_{0};
};

// One initialized module bound to an addon id. Shared by the registry record, every
// snapshot that lists its hooks, and every in-flight invocation; the module is shut
// down when the last of them lets go.
class AddonInstance : common::noncopyable {
public:
    AddonInstance(std::string addonId, std::uint64_t serial, std::unique_ptr<AddonModule> module);
    ~AddonInstance();

    bool Init(const AddonSettings& settings, std::string* error);

    // Runs the module's handler. Exceptions are converted to a failed outcome.
    HookOutcome Invoke(const std::string& hook, const TrafficEvent& event);

    const std::string& addonId() const { return addonId_; }
    std::uint64_t serial() const { return serial_; }
    AddonModule& module() { return *module_; }
    const AddonModule& module() const { return *module_; }
    int inFlight() const { return inFlight_.load(std::memory_order_acquire); }
    FailureTracker& failures() { return failures_; }
    const FailureTracker& failures() const { return failures_; }
    long long invocations() const { return invocations_.load(std::memory_order_relaxed); }

    // Executor tasks of this instance still running after their caller gave up on them.
    int abandoned() const { return abandoned_.load(std::memory_order_acquire); }
    void AddAbandoned() { abandoned_.fetch_add(1, std::memory_order_acq_rel); }
    void ReleaseAbandoned() { abandoned_.fetch_sub(1, std::memory_order_acq_rel); }

private:
    std::string addonId_;
    std::uint64_t serial_;
    std::unique_ptr<AddonModule> module_;
    bool initialized_{false};
    std::atomic<int> inFlight_{0};
    std::atomic<long long> invocations_{0};
    std::atomic<int> abandoned_{0};
    FailureTracker failures_;
};

} // namespace core
} // namespace addonhub
