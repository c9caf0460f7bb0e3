#pragma once

#include "addonhub/common/noncopyable.h"
#include "addonhub/core/AddonRegistry.h"
#include "addonhub/core/HookExecutor.h"
#include "addonhub/core/RuleMatcher.h"
#include "addonhub/core/TrafficEvent.h"
#include "addonhub/monitor/DispatchStats.h"

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>

namespace addonhub {
namespace common {
class Config;
}

namespace core {

struct DispatcherOptions {
    // Per-hook budget; 0 disables timeouts.
    std::chrono::milliseconds hookTimeout{50};
    // Consecutive failures inside `failureWindow` that quarantine an addon; 0 disables.
    int failureThreshold{5};
    std::chrono::milliseconds failureWindow{60000};
    // Workers for hooks declared blocking; 0 runs them inline.
    size_t executorThreads{2};
    // Whole-cycle budget; 0 means unbounded.
    std::chrono::milliseconds cycleBudget{0};
    // Longest subject a regex predicate is evaluated against.
    size_t regexSubjectLimit{RuleMatcher::kDefaultRegexSubjectLimit};

    // Reads the [dispatcher] section.
    static DispatcherOptions FromConfig(const common::Config& conf);
};

class Dispatcher : common::noncopyable {
public:
    using Clock = std::chrono::steady_clock;
    using QuarantineFn = std::function<void(const std::string& addonId, std::uint64_t serial, const std::string& reason)>;
    // Observes every invocation in order; set before dispatching starts.
    using TraceFn = std::function<void(const TrafficEvent& event, const HookEntry& entry, const HookOutcome& outcome)>;

    Dispatcher(const AddonRegistry* registry, DispatcherOptions opts);
    ~Dispatcher();

    void SetQuarantineHandler(QuarantineFn fn) { quarantine_ = std::move(fn); }
    void SetTraceHandler(TraceFn fn) { trace_ = std::move(fn); }

    // Runs one dispatch cycle against the snapshot current at entry and returns the
    // merged verdict (also left in event.verdict()).
    Verdict Handle(TrafficEvent& event);
    // Same, but stops invoking hooks once `deadline` has passed.
    Verdict Handle(TrafficEvent& event, Clock::time_point deadline);

    const DispatcherOptions& options() const { return opts_; }
    const monitor::DispatchStats& stats() const { return stats_; }

private:
    HookOutcome Invoke(const HookEntry& entry, const TrafficEvent& event, Clock::time_point deadline);
    HookOutcome InvokeBlocking(const HookEntry& entry, const TrafficEvent& event, Clock::time_point deadline);
    void RecordFailure(const HookEntry& entry, const HookOutcome& outcome);

    const AddonRegistry* registry_;
    DispatcherOptions opts_;
    std::unique_ptr<HookExecutor> executor_;
    QuarantineFn quarantine_;
    TraceFn trace_;
    monitor::DispatchStats stats_;
};

} // namespace core
} // namespace addonhub
