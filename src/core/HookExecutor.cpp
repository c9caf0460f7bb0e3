#include "addonhub/core/HookExecutor.h"
#include "addonhub/common/Logger.h"

#include <algorithm>
#include <pthread.h>
#include <utility>

namespace addonhub {
namespace core {

HookExecutor::HookExecutor(size_t threads, const std::string& name, size_t maxQueue)
    : name_(name), maxQueue_(maxQueue ? maxQueue : std::max<size_t>(threads, 1) * 64) {
    workers_.reserve(threads);
    for (size_t i = 0; i < threads; ++i) {
        workers_.emplace_back(&HookExecutor::WorkerLoop, this);
        const std::string threadName = (name_ + "-" + std::to_string(i)).substr(0, 15);
        ::pthread_setname_np(workers_.back().native_handle(), threadName.c_str());
    }
}

HookExecutor::~HookExecutor() {
    Stop();
}

void HookExecutor::Stop() {
    std::deque<Job> dropped;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_ && workers_.empty()) return;
        stopping_ = true;
        dropped.swap(queue_);
    }
    cond_.notify_all();
    for (auto& job : dropped) {
        job.ticket->TryCancel();
        job.result->set_value(Expired("executor stopped"));
    }
    for (auto& t : workers_) {
        if (t.joinable()) t.join();
    }
    workers_.clear();
}

size_t HookExecutor::QueueDepth() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
}

HookOutcome HookExecutor::Expired(const std::string& why) {
    HookOutcome outcome;
    outcome.status = HookOutcome::Status::kExpired;
    outcome.error = why;
    return outcome;
}

std::future<HookOutcome> HookExecutor::Submit(std::shared_ptr<HookTicket> ticket,
                                              Clock::time_point deadline,
                                              std::function<HookOutcome()> task) {
    Job job;
    job.ticket = std::move(ticket);
    job.deadline = deadline;
    job.task = std::move(task);
    job.result = std::make_shared<std::promise<HookOutcome>>();
    std::future<HookOutcome> fut = job.result->get_future();

    std::string refused;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_) {
            refused = "executor stopped";
        } else {
            if (queue_.size() >= maxQueue_) {
                // Callers that gave up leave cancelled jobs behind; drop them first.
                queue_.erase(std::remove_if(queue_.begin(), queue_.end(),
                                            [](const Job& j) { return j.ticket->state() == HookTicket::kCancelled; }),
                             queue_.end());
            }
            if (queue_.size() >= maxQueue_) {
                refused = "executor queue full";
            } else {
                queue_.push_back(std::move(job));
                cond_.notify_one();
                return fut;
            }
        }
    }
    job.ticket->TryCancel();
    job.result->set_value(Expired(refused));
    return fut;
}

void HookExecutor::Run(Job& job) {
    if (Clock::now() >= job.deadline) job.ticket->TryCancel();
    if (!job.ticket->TryStart()) {
        job.result->set_value(Expired("deadline passed before the hook started"));
        return;
    }
    try {
        job.result->set_value(job.task());
    } catch (const std::exception& e) {
        HookOutcome outcome;
        outcome.status = HookOutcome::Status::kFailed;
        outcome.error = std::string("hook task threw: ") + e.what();
        job.result->set_value(std::move(outcome));
    }
}

void HookExecutor::WorkerLoop() {
    while (true) {
        Job job;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            cond_.wait(lock, [this] { return stopping_ || !queue_.empty(); });
            if (stopping_ && queue_.empty()) break;
            job = std::move(queue_.front());
            queue_.pop_front();
        }
        Run(job);
    }
    LOG_DEBUG << "Hook executor worker exiting: " << name_;
}

} // namespace core
} // namespace addonhub
