#pragma once

#include "addonhub/common/noncopyable.h"
#include "addonhub/core/Addon.h"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace addonhub {
namespace core {

// Hand-off state between the caller waiting on a task and the worker that runs it.
// Exactly one transition out of kQueued and one out of kRunning ever succeeds.
class HookTicket {
public:
    enum State { kQueued, kRunning, kDone, kCancelled, kAbandoned };

    bool TryStart() { return Move(kQueued, kRunning); }
    bool TryFinish() { return Move(kRunning, kDone); }
    bool TryCancel() { return Move(kQueued, kCancelled); }
    bool TryAbandon() { return Move(kRunning, kAbandoned); }
    State state() const { return static_cast<State>(state_.load(std::memory_order_acquire)); }

private:
    bool Move(State from, State to) {
        int expected = from;
        return state_.compare_exchange_strong(expected, to, std::memory_order_acq_rel);
    }

    std::atomic<int> state_{kQueued};
};

// Fixed pool that runs hooks which may block, off the event path. The caller waits on
// the returned future with its own deadline. A task still queued at its deadline never
// starts and completes as kExpired; a task that outlives the deadline keeps running here
// and its result is discarded.
class HookExecutor : common::noncopyable {
public:
    using Clock = std::chrono::steady_clock;

    // `maxQueue` 0 means 64 per thread.
    explicit HookExecutor(size_t threads, const std::string& name = "hook-exec", size_t maxQueue = 0);
    ~HookExecutor();

    std::future<HookOutcome> Submit(std::shared_ptr<HookTicket> ticket,
                                    Clock::time_point deadline,
                                    std::function<HookOutcome()> task);

    // Finishes tasks that already started; unstarted tasks are dropped.
    void Stop();

    size_t threads() const { return workers_.size(); }
    size_t QueueDepth() const;

    static HookOutcome Expired(const std::string& why);

private:
    struct Job {
        std::shared_ptr<HookTicket> ticket;
        Clock::time_point deadline;
        std::function<HookOutcome()> task;
        std::shared_ptr<std::promise<HookOutcome>> result;
    };

    void WorkerLoop();
    static void Run(Job& job);

    std::string name_;
    size_t maxQueue_;
    std::vector<std::thread> workers_;
    mutable std::mutex mutex_;
    std::condition_variable cond_;
    std::deque<Job> queue_;
    bool stopping_{false};
};

} // namespace core
} // namespace addonhub
