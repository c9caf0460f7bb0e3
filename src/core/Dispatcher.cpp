#include "addonhub/core/Dispatcher.h"
#include "addonhub/common/Config.h"
#include "addonhub/common/Logger.h"
#include "addonhub/core/RuleMatcher.h"

#include <algorithm>
#include <future>
#include <sstream>
#include <utility>

namespace addonhub {
namespace core {

DispatcherOptions DispatcherOptions::FromConfig(const common::Config& conf) {
    DispatcherOptions o;
    o.hookTimeout = std::chrono::milliseconds(std::max(0, conf.GetInt("dispatcher", "hook_timeout_ms", 50)));
    o.failureThreshold = std::max(0, conf.GetInt("dispatcher", "failure_threshold", 5));
    o.failureWindow = std::chrono::milliseconds(std::max(0, conf.GetInt("dispatcher", "failure_window_ms", 60000)));
    o.executorThreads = static_cast<size_t>(std::max(0, conf.GetInt("dispatcher", "executor_threads", 2)));
    o.cycleBudget = std::chrono::milliseconds(std::max(0, conf.GetInt("dispatcher", "cycle_budget_ms", 0)));
    o.regexSubjectLimit = static_cast<size_t>(std::max(
        1, conf.GetInt("dispatcher", "regex_max_subject", static_cast<int>(RuleMatcher::kDefaultRegexSubjectLimit))));
    return o;
}

Dispatcher::Dispatcher(const AddonRegistry* registry, DispatcherOptions opts)
    : registry_(registry), opts_(opts) {
    if (opts_.executorThreads > 0) {
        executor_ = std::make_unique<HookExecutor>(opts_.executorThreads);
    }
    RuleMatcher::SetRegexSubjectLimit(opts_.regexSubjectLimit);
    LOG_INFO << "Dispatcher ready: hook_timeout_ms=" << opts_.hookTimeout.count()
             << " failure_threshold=" << opts_.failureThreshold
             << " failure_window_ms=" << opts_.failureWindow.count()
             << " executor_threads=" << opts_.executorThreads
             << " regex_max_subject=" << opts_.regexSubjectLimit;
}

Dispatcher::~Dispatcher() {
    if (executor_) executor_->Stop();
}

Verdict Dispatcher::Handle(TrafficEvent& event) {
    return Handle(event, Clock::time_point::max());
}

Verdict Dispatcher::Handle(TrafficEvent& event, Clock::time_point deadline) {
    stats_.IncEvents();
    if (registry_->corrupted()) {
        // Core is unusable; traffic still flows untouched.
        stats_.IncPassThrough();
        return event.verdict();
    }

    // The one snapshot read of this cycle.
    const std::shared_ptr<const RegistrySnapshot> snap = registry_->Current();
    const std::vector<HookEntry>& hooks = snap->HooksFor(event.kind());

    if (opts_.cycleBudget.count() > 0) {
        deadline = std::min(deadline, Clock::now() + opts_.cycleBudget);
    }
    const bool bounded = deadline != Clock::time_point::max();

    for (size_t i = 0; i < hooks.size(); ++i) {
        const HookEntry& entry = hooks[i];
        if (bounded && Clock::now() >= deadline) {
            stats_.IncBudgetSkips();
            LOG_WARN << "Dispatch budget exhausted for flow " << event.flowId() << ": skipped "
                     << (hooks.size() - i) << " " << EventKindName(event.kind()) << " hooks";
            break;
        }
        if (!RuleMatcher::Matches(*entry.rule, event)) continue;

        const HookOutcome outcome = Invoke(entry, event, deadline);
        if (outcome.status == HookOutcome::Status::kExpired) {
            // Never started; not counted against the addon.
            stats_.IncExpired();
            if (trace_) trace_(event, entry, outcome);
            LOG_DEBUG << "Hook " << entry.addonId << "/" << entry.hookName << " expired: " << outcome.error;
            continue;
        }
        stats_.IncInvocations();
        stats_.RecordHookLatencyUs(outcome.elapsed.count());
        if (trace_) trace_(event, entry, outcome);

        if (!outcome.ok()) {
            RecordFailure(entry, outcome);
            continue;
        }
        entry.instance->failures().RecordSuccess();
        event.mutable_verdict()->Merge(entry.addonId, outcome.contribution);

        if (entry.rule->shortCircuit && outcome.contribution.IsTerminal()) {
            stats_.IncShortCircuits();
            LOG_DEBUG << "Hook " << entry.addonId << "/" << entry.hookName << " short-circuited flow "
                      << event.flowId();
            break;
        }
    }

    const Verdict& v = event.verdict();
    if (v.IsPassThrough()) stats_.IncPassThrough();
    if (v.IsTerminal()) stats_.IncTerminal();
    return v;
}

HookOutcome Dispatcher::Invoke(const HookEntry& entry, const TrafficEvent& event, Clock::time_point deadline) {
    if (entry.blocking && executor_) return InvokeBlocking(entry, event, deadline);

    const auto timeout = opts_.hookTimeout;
    HookOutcome outcome = entry.instance->Invoke(entry.hookName, event);
    if (outcome.ok() && timeout.count() > 0 && outcome.elapsed > timeout) {
        std::ostringstream why;
        why << "took " << outcome.elapsed.count() / 1000 << "ms, budget " << timeout.count() << "ms";
        outcome.status = HookOutcome::Status::kTimeout;
        outcome.error = why.str();
        outcome.contribution = Contribution();
    }
    return outcome;
}

HookOutcome Dispatcher::InvokeBlocking(const HookEntry& entry, const TrafficEvent& event, Clock::time_point deadline) {
    const auto start = Clock::now();
    auto elapsed = [&start]() { return std::chrono::duration_cast<std::chrono::microseconds>(Clock::now() - start); };

    // The wait ends at the earlier of the hook timeout and the cycle deadline.
    Clock::time_point until = deadline;
    if (opts_.hookTimeout.count() > 0) until = std::min(until, start + opts_.hookTimeout);
    const bool bounded = until != Clock::time_point::max();
    if (bounded && until <= start) return HookExecutor::Expired("no time left in the cycle");

    const std::shared_ptr<AddonInstance> inst = entry.instance;
    if (inst->abandoned() > 0) {
        HookOutcome outcome;
        outcome.status = HookOutcome::Status::kTimeout;
        outcome.error = "previous call still running past its deadline";
        return outcome;
    }

    auto ticket = std::make_shared<HookTicket>();
    const std::string hook = entry.hookName;
    TrafficEvent copy = event;
    std::future<HookOutcome> fut = executor_->Submit(ticket, until, [inst, ticket, hook, copy]() {
        HookOutcome outcome = inst->Invoke(hook, copy);
        // The caller gave up on this call; it no longer counts as outstanding.
        if (!ticket->TryFinish()) inst->ReleaseAbandoned();
        return outcome;
    });

    if (bounded && fut.wait_until(until) != std::future_status::ready) {
        if (ticket->TryCancel()) {
            HookOutcome outcome = HookExecutor::Expired("not started within " +
                                                        std::to_string(elapsed().count() / 1000) + "ms");
            outcome.elapsed = elapsed();
            return outcome;
        }
        inst->AddAbandoned();
        if (ticket->TryAbandon()) {
            HookOutcome outcome;
            outcome.status = HookOutcome::Status::kTimeout;
            outcome.error = "no result within " + std::to_string(elapsed().count() / 1000) + "ms";
            outcome.elapsed = elapsed();
            return outcome;
        }
        // Finished between the wait and the hand-off; the result is ready.
        inst->ReleaseAbandoned();
    }

    HookOutcome outcome;
    try {
        outcome = fut.get();
    } catch (const std::future_error& e) {
        outcome = HookOutcome();
        outcome.status = HookOutcome::Status::kFailed;
        outcome.error = std::string("hook task abandoned: ") + e.what();
    }
    outcome.elapsed = elapsed();
    return outcome;
}

void Dispatcher::RecordFailure(const HookEntry& entry, const HookOutcome& outcome) {
    if (outcome.status == HookOutcome::Status::kTimeout) {
        stats_.IncTimeouts();
    } else {
        stats_.IncFailures();
    }
    LOG_WARN << "Hook " << entry.addonId << "/" << entry.hookName << " " << HookOutcomeStatusName(outcome.status)
             << ": " << outcome.error;

    const bool tripped = entry.instance->failures().RecordFailureAt(
        Clock::now(), outcome.error, opts_.failureThreshold, opts_.failureWindow);
    if (!tripped) return;

    stats_.IncQuarantineRequests();
    std::ostringstream reason;
    reason << entry.instance->failures().consecutive() << " consecutive failures within "
           << opts_.failureWindow.count() << "ms, last: " << outcome.error;
    LOG_ERROR << "Addon " << entry.addonId << " exceeded its failure threshold: " << reason.str();
    if (quarantine_) quarantine_(entry.addonId, entry.instance->serial(), reason.str());
}

} // namespace core
} // namespace addonhub
