#include "addonhub/core/Addon.h"
#include "addonhub/common/Logger.h"

#include <exception>
#include <utility>

namespace addonhub {
namespace core {

const char* AddonStateName(AddonState state) {
    switch (state) {
        case AddonState::kInstalled: return "installed";
        case AddonState::kLoaded: return "loaded";
        case AddonState::kActive: return "active";
        case AddonState::kDisabled: return "disabled";
        case AddonState::kError: return "error";
        case AddonState::kUnloaded: return "unloaded";
    }
    return "unknown";
}

const char* HookOutcomeStatusName(HookOutcome::Status status) {
    switch (status) {
        case HookOutcome::Status::kOk: return "ok";
        case HookOutcome::Status::kFailed: return "failed";
        case HookOutcome::Status::kTimeout: return "timeout";
        case HookOutcome::Status::kExpired: return "expired";
    }
    return "unknown";
}

bool FailureTracker::RecordFailureAt(Clock::time_point now,
                                     const std::string& reason,
                                     int threshold,
                                     Clock::duration window) {
    totalFailures_.fetch_add(1, std::memory_order_relaxed);
    std::lock_guard<std::mutex> lock(mutex_);
    lastError_ = reason;
    streak_.push_back(now);
    while (!streak_.empty() && now - streak_.front() > window) {
        streak_.pop_front();
    }
    consecutive_.store(static_cast<int>(streak_.size()), std::memory_order_relaxed);
    if (threshold <= 0) return false;
    return static_cast<int>(streak_.size()) >= threshold;
}

void FailureTracker::RecordSuccess() {
    if (consecutive_.load(std::memory_order_relaxed) == 0) return;
    std::lock_guard<std::mutex> lock(mutex_);
    streak_.clear();
    consecutive_.store(0, std::memory_order_relaxed);
}

int FailureTracker::consecutive() const {
    return consecutive_.load(std::memory_order_relaxed);
}

std::string FailureTracker::lastError() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return lastError_;
}

AddonInstance::AddonInstance(std::string addonId, std::uint64_t serial, std::unique_ptr<AddonModule> module)
    : addonId_(std::move(addonId)), serial_(serial), module_(std::move(module)) {}

AddonInstance::~AddonInstance() {
    if (!module_ || !initialized_) return;
    try {
        module_->Shutdown();
    } catch (const std::exception& e) {
        LOG_WARN << "Addon shutdown threw: id=" << addonId_ << " serial=" << serial_ << " err=" << e.what();
    }
    LOG_INFO << "Addon resources released: id=" << addonId_ << " serial=" << serial_;
}

bool AddonInstance::Init(const AddonSettings& settings, std::string* error) {
    if (!module_) {
        if (error) *error = "no module";
        return false;
    }
    std::string why;
    bool ok = false;
    try {
        ok = module_->Init(settings, &why);
    } catch (const std::exception& e) {
        ok = false;
        why = std::string("init threw: ") + e.what();
    }
    if (!ok) {
        if (why.empty()) why = "init refused";
        if (error) *error = why;
        return false;
    }
    initialized_ = true;
    return true;
}

HookOutcome AddonInstance::Invoke(const std::string& hook, const TrafficEvent& event) {
    struct InFlightGuard {
        std::atomic<int>& n;
        explicit InFlightGuard(std::atomic<int>& c) : n(c) { n.fetch_add(1, std::memory_order_acq_rel); }
        ~InFlightGuard() { n.fetch_sub(1, std::memory_order_acq_rel); }
    } guard(inFlight_);

    invocations_.fetch_add(1, std::memory_order_relaxed);
    HookOutcome outcome;
    const auto start = std::chrono::steady_clock::now();
    std::string why;
    bool ok = false;
    try {
        ok = module_->Handle(hook, event, &outcome.contribution, &why);
    } catch (const std::exception& e) {
        ok = false;
        why = std::string("hook threw: ") + e.what();
    } catch (...) {
        ok = false;
        why = "hook threw a non-standard exception";
    }
    outcome.elapsed = std::chrono::duration_cast<std::chrono::microseconds>(std::chrono::steady_clock::now() - start);
    if (!ok) {
        outcome.status = HookOutcome::Status::kFailed;
        outcome.error = why.empty() ? "hook reported failure" : why;
        outcome.contribution = Contribution();
    }
    return outcome;
}

} // namespace core
} // namespace addonhub
