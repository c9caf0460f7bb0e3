#include "addonhub/common/Logger.h"
#include "addonhub/core/Dispatcher.h"
#include "addonhub/core/LifecycleManager.h"
#include "TestAddons.h"

#include <atomic>
#include <cassert>
#include <chrono>
#include <future>
#include <string>
#include <thread>

using addonhub::common::Error;
using addonhub::core::AddonConfig;
using addonhub::core::AddonRegistry;
using addonhub::core::AddonState;
using addonhub::core::AddonStatus;
using addonhub::core::Dispatcher;
using addonhub::core::DispatcherOptions;
using addonhub::core::EventKind;
using addonhub::core::FindHeader;
using addonhub::core::InstallOptions;
using addonhub::core::LifecycleManager;
using addonhub::core::Verdict;
using testaddons::Counters;
using testaddons::Hook;
using testaddons::Script;

namespace {

// Holds a hook inside its handler until the test lets it go.
struct Gate {
    std::atomic<bool> entered{false};
    std::atomic<bool> released{false};

    void WaitEntered() const {
        while (!entered.load()) std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
};

Script slowScript(const std::string& name, Gate* gate, std::shared_ptr<Counters> counters) {
    Script s;
    s.name = name;
    s.counters = counters;
    s.hooks.push_back(Hook("slow", EventKind::kRequest));
    s.handler = [gate](const std::string&, const testaddons::TrafficEvent&, testaddons::Contribution* out,
                       std::string*) {
        gate->entered.store(true);
        while (!gate->released.load()) std::this_thread::sleep_for(std::chrono::milliseconds(1));
        out->setHeaders.push_back({"X-Slow", "done"});
        return true;
    };
    return s;
}

bool install(LifecycleManager* m, const Script& s) {
    Error err;
    InstallOptions opts;
    opts.enable = true;
    std::string id;
    return m->InstallAddon(testaddons::Factory(s), AddonConfig(), opts, &id, &err);
}

DispatcherOptions inlineOptions() {
    DispatcherOptions o;
    o.executorThreads = 0;
    o.hookTimeout = std::chrono::milliseconds(10000);
    return o;
}

} // namespace

int main() {
    addonhub::common::Logger::Instance().SetLevel(addonhub::common::LogLevel::ERROR);

    // Uninstall while a hook is running: the call returns at once, teardown waits.
    {
        AddonRegistry reg;
        LifecycleManager m(&reg);
        Dispatcher d(&reg, inlineOptions());
        Gate gate;
        auto counters = std::make_shared<Counters>();
        assert(install(&m, slowScript("slow", &gate, counters)));

        auto inflight = std::async(std::launch::async, [&]() {
            return testaddons::Dispatch(d, EventKind::kRequest, "example.com", "/");
        });
        gate.WaitEntered();
        assert(m.ListAddons()[0].inFlight == 1);

        Error err;
        const auto start = std::chrono::steady_clock::now();
        assert(m.UninstallAddon("slow", &err));
        assert(std::chrono::steady_clock::now() - start < std::chrono::milliseconds(500));
        assert(m.ListAddons().empty());
        assert(reg.Current()->HookCount() == 0);
        // New events no longer see it.
        assert(testaddons::Dispatch(d, EventKind::kRequest, "example.com", "/").IsPassThrough());
        assert(counters->shutdowns.load() == 0);
        assert(counters->destroyed.load() == 0);

        gate.released.store(true);
        Verdict v = inflight.get();
        // The in-flight cycle finished against the code it started with.
        assert(*FindHeader(v.setHeaders, "X-Slow") == "done");
        assert(counters->shutdowns.load() == 1);
        assert(counters->destroyed.load() == 1);
    }

    // Disable keeps the instance alive; the in-flight call still completes.
    {
        AddonRegistry reg;
        LifecycleManager m(&reg);
        Dispatcher d(&reg, inlineOptions());
        Gate gate;
        auto counters = std::make_shared<Counters>();
        assert(install(&m, slowScript("slow", &gate, counters)));

        auto inflight = std::async(std::launch::async, [&]() {
            return testaddons::Dispatch(d, EventKind::kRequest, "example.com", "/");
        });
        gate.WaitEntered();
        Error err;
        assert(m.DisableAddon("slow", &err));
        AddonStatus st;
        assert(m.GetAddonState("slow", &st, &err) && st.state == AddonState::kDisabled);

        gate.released.store(true);
        assert(*FindHeader(inflight.get().setHeaders, "X-Slow") == "done");
        assert(counters->shutdowns.load() == 0);

        assert(m.EnableAddon("slow", &err));
        assert(counters->inits.load() == 1);
        m.Shutdown();
        assert(counters->shutdowns.load() == 1);
    }

    // Upgrade while the old code runs: old instance is released after its call returns,
    // new events already go to the new code.
    {
        AddonRegistry reg;
        LifecycleManager m(&reg);
        Dispatcher d(&reg, inlineOptions());
        Gate gate;
        auto oldCounters = std::make_shared<Counters>();
        assert(install(&m, slowScript("swap", &gate, oldCounters)));

        auto inflight = std::async(std::launch::async, [&]() {
            return testaddons::Dispatch(d, EventKind::kRequest, "example.com", "/");
        });
        gate.WaitEntered();

        auto newCounters = std::make_shared<Counters>();
        Script next;
        next.name = "swap";
        next.version = "2.0";
        next.counters = newCounters;
        next.hooks.push_back(Hook("fast", EventKind::kRequest));
        next.handler = testaddons::Tagger("new");
        Error err;
        assert(m.UpgradeAddon("swap", testaddons::Factory(next), &err));

        Verdict fresh = testaddons::Dispatch(d, EventKind::kRequest, "example.com", "/");
        assert(*FindHeader(fresh.setHeaders, "X-Tag") == "new/fast");
        assert(oldCounters->shutdowns.load() == 0);

        gate.released.store(true);
        assert(*FindHeader(inflight.get().setHeaders, "X-Slow") == "done");
        assert(oldCounters->shutdowns.load() == 1);
        assert(newCounters->shutdowns.load() == 0);

        m.Shutdown();
        assert(newCounters->shutdowns.load() == 1);
    }

    // A blocking hook abandoned past its deadline is torn down once it finally returns.
    {
        AddonRegistry reg;
        LifecycleManager m(&reg);
        DispatcherOptions o;
        o.executorThreads = 1;
        o.hookTimeout = std::chrono::milliseconds(20);
        Gate gate;
        auto counters = std::make_shared<Counters>();
        Script s = slowScript("stuck", &gate, counters);
        s.hooks[0].blocking = true;
        assert(install(&m, s));
        {
            Dispatcher d(&reg, o);
            Verdict v = testaddons::Dispatch(d, EventKind::kRequest, "example.com", "/");
            assert(v.IsPassThrough());
            assert(d.stats().timeouts() == 1);

            Error err;
            assert(m.UninstallAddon("stuck", &err));
            assert(counters->shutdowns.load() == 0);
            gate.released.store(true);
            // Dispatcher teardown joins the executor, which lets go of the last reference.
        }
        assert(counters->shutdowns.load() == 1);
    }
    return 0;
}
