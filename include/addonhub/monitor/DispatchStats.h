#pragma once

#include <atomic>
#include <chrono>
#include <string>

namespace addonhub {
namespace monitor {

// Counters for the dispatch path. All updates are relaxed atomics.
class DispatchStats {
public:
    DispatchStats();

    void IncEvents() { events_.fetch_add(1, std::memory_order_relaxed); }
    void IncPassThrough() { passThrough_.fetch_add(1, std::memory_order_relaxed); }
    void IncTerminal() { terminal_.fetch_add(1, std::memory_order_relaxed); }
    void IncInvocations() { invocations_.fetch_add(1, std::memory_order_relaxed); }
    void IncFailures() { failures_.fetch_add(1, std::memory_order_relaxed); }
    void IncTimeouts() { timeouts_.fetch_add(1, std::memory_order_relaxed); }
    void IncShortCircuits() { shortCircuits_.fetch_add(1, std::memory_order_relaxed); }
    void IncExpired() { expired_.fetch_add(1, std::memory_order_relaxed); }
    void IncBudgetSkips() { budgetSkips_.fetch_add(1, std::memory_order_relaxed); }
    void IncQuarantineRequests() { quarantineRequests_.fetch_add(1, std::memory_order_relaxed); }
    void RecordHookLatencyUs(long long us);

    long long events() const { return events_.load(std::memory_order_relaxed); }
    long long passThrough() const { return passThrough_.load(std::memory_order_relaxed); }
    long long terminal() const { return terminal_.load(std::memory_order_relaxed); }
    long long invocations() const { return invocations_.load(std::memory_order_relaxed); }
    long long failures() const { return failures_.load(std::memory_order_relaxed); }
    long long timeouts() const { return timeouts_.load(std::memory_order_relaxed); }
    long long shortCircuits() const { return shortCircuits_.load(std::memory_order_relaxed); }
    long long expired() const { return expired_.load(std::memory_order_relaxed); }
    long long budgetSkips() const { return budgetSkips_.load(std::memory_order_relaxed); }
    long long quarantineRequests() const { return quarantineRequests_.load(std::memory_order_relaxed); }

    std::string ToJson() const;

private:
    std::atomic<long long> events_{0};
    std::atomic<long long> passThrough_{0};
    std::atomic<long long> terminal_{0};
    std::atomic<long long> invocations_{0};
    std::atomic<long long> failures_{0};
    std::atomic<long long> timeouts_{0};
    std::atomic<long long> shortCircuits_{0};
    std::atomic<long long> expired_{0};
    std::atomic<long long> budgetSkips_{0};
    std::atomic<long long> quarantineRequests_{0};
    std::atomic<long long> hookLatencyUsTotal_{0};
    std::atomic<long long> hookLatencyUsMax_{0};
    std::chrono::steady_clock::time_point startTime_;
};

std::string JsonEscape(const std::string& s);

} // namespace monitor
} // namespace addonhub
