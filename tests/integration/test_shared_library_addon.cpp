#include "addonhub/common/Config.h"
#include "addonhub/common/Logger.h"
#include "addonhub/core/AddonLoader.h"
#include "addonhub/core/Dispatcher.h"
#include "addonhub/core/LifecycleManager.h"
#include "addonhub/core/SharedLibraryAddon.h"
#include "TestAddons.h"

#include <cassert>
#include <cstdio>
#include <fstream>
#include <string>
#include <vector>

#ifndef ADDONHUB_EXAMPLE_ADDON_PATH
#error "ADDONHUB_EXAMPLE_ADDON_PATH must point at the example addon library"
#endif
#ifndef ADDONHUB_EXAMPLE_ADDON_V2_PATH
#error "ADDONHUB_EXAMPLE_ADDON_V2_PATH must point at the 2.0 build of the example addon"
#endif

using addonhub::common::Config;
using addonhub::common::Error;
using addonhub::common::ErrorCode;
using addonhub::core::AddonConfig;
using addonhub::core::AddonLoader;
using addonhub::core::AddonRegistry;
using addonhub::core::AddonState;
using addonhub::core::AddonStatus;
using addonhub::core::AddonSummary;
using addonhub::core::Dispatcher;
using addonhub::core::DispatcherOptions;
using addonhub::core::EventKind;
using addonhub::core::FindHeader;
using addonhub::core::InstallOptions;
using addonhub::core::LifecycleManager;
using addonhub::core::SharedLibraryAddon;
using addonhub::core::Verdict;

static const char* kLib = ADDONHUB_EXAMPLE_ADDON_PATH;
static const char* kLibV2 = ADDONHUB_EXAMPLE_ADDON_V2_PATH;

// Replaces `to` with a copy of `from`, the way a deploy drops a new build in place.
static void copyFile(const std::string& from, const std::string& to) {
    std::ifstream in(from, std::ios::binary);
    assert(in);
    std::ofstream out(to, std::ios::binary | std::ios::trunc);
    assert(out);
    out << in.rdbuf();
    out.close();
    assert(out);
}

static bool install(LifecycleManager* m, const std::string& id, const std::string& pin, AddonConfig cfg, Error* err) {
    InstallOptions opts;
    opts.id = id;
    opts.enable = true;
    std::string out;
    return m->InstallAddon(SharedLibraryAddon::Factory(kLib, pin), std::move(cfg), opts, &out, err);
}

int main() {
    addonhub::common::Logger::Instance().SetLevel(addonhub::common::LogLevel::ERROR);

    std::string digest;
    {
        std::string error;
        assert(SharedLibraryAddon::Sha256File(kLib, &digest, &error));
        assert(digest.size() == 64);
        assert(digest.find_first_not_of("0123456789abcdef") == std::string::npos);

        std::string again;
        assert(SharedLibraryAddon::Sha256File(kLib, &again, &error));
        assert(again == digest);

        assert(!SharedLibraryAddon::Sha256File("/nonexistent/addon.so", &again, &error));
        assert(!error.empty());
    }

    // Known digest of a small file.
    {
        const char* path = "sha256_test.bin";
        std::FILE* fp = std::fopen(path, "wb");
        assert(fp);
        std::fputs("abc", fp);
        std::fclose(fp);
        std::string hex;
        std::string error;
        assert(SharedLibraryAddon::Sha256File(path, &hex, &error));
        assert(hex == "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
        std::remove(path);
    }

    // Opening the library exposes its metadata and declared hooks.
    {
        std::string error;
        auto addon = SharedLibraryAddon::Open(kLib, digest, &error);
        assert(addon);
        assert(addon->Name() == "example_addon");
        assert(addon->Version() == "1.0");
        assert(addon->Fingerprint() == digest);
        const auto hooks = addon->Hooks();
        assert(hooks.size() == 3);
        assert(hooks[0].name == "tag" && hooks[0].kind == EventKind::kRequest && hooks[0].priority == 10);
        assert(hooks[1].name == "deny" && hooks[1].kind == EventKind::kRequestHeaders && hooks[1].shortCircuit);
        assert(hooks[2].rule == "path prefix /fail");
    }

    // Installed and dispatched through the engine.
    {
        AddonRegistry reg;
        LifecycleManager m(&reg);
        Error err;
        AddonConfig cfg;
        cfg.settings["greeting"] = "hi";
        assert(install(&m, "example", digest, cfg, &err));

        const std::vector<AddonSummary> list = m.ListAddons();
        assert(list.size() == 1);
        assert(list[0].fingerprint == digest);
        assert(list[0].state == AddonState::kActive);

        DispatcherOptions o;
        o.executorThreads = 0;
        o.hookTimeout = std::chrono::milliseconds(1000);
        Dispatcher d(&reg, o);

        Verdict v = testaddons::Dispatch(d, EventKind::kRequest, "example.com", "/index.html");
        assert(v.action == Verdict::Action::kModify);
        assert(*FindHeader(v.setHeaders, "X-Example-Addon") == "hi");
        assert(*FindHeader(v.setHeaders, "X-Example-Version") == "1.0");

        v = testaddons::Dispatch(d, EventKind::kRequestHeaders, "example.com", "/admin/users");
        assert(v.action == Verdict::Action::kBlock);
        assert(v.status == 403 && v.reason == "admin area");
        assert(v.terminalAddon == "example");
        assert(v.annotations.size() == 1 && v.annotations[0] == "example: denied by example_addon");

        v = testaddons::Dispatch(d, EventKind::kRequestHeaders, "example.com", "/public");
        assert(v.IsPassThrough());

        // A failing hook keeps earlier contributions and is counted.
        v = testaddons::Dispatch(d, EventKind::kRequest, "example.com", "/fail/now");
        assert(v.action == Verdict::Action::kModify);
        assert(FindHeader(v.setHeaders, "X-Example-Addon"));
        assert(d.stats().failures() == 1);
        AddonStatus st;
        assert(m.GetAddonState("example", &st, &err) && st.state == AddonState::kActive);
        assert(m.ListAddons()[0].consecutiveFailures == 1);

        assert(m.UninstallAddon("example", &err));
        assert(testaddons::Dispatch(d, EventKind::kRequest, "example.com", "/").IsPassThrough());
    }

    // Upgrading from a path whose file was replaced loads the new build, even while the
    // old build is still mapped by a live instance.
    {
        const std::string live = "example_live.so";
        copyFile(kLib, live);

        std::string v1Digest, v2Digest, error;
        assert(SharedLibraryAddon::Sha256File(kLib, &v1Digest, &error));
        assert(SharedLibraryAddon::Sha256File(kLibV2, &v2Digest, &error));
        assert(v1Digest != v2Digest);

        AddonRegistry reg;
        LifecycleManager m(&reg);
        Error err;
        InstallOptions opts;
        opts.id = "live";
        opts.enable = true;
        std::string id;
        assert(m.InstallAddon(SharedLibraryAddon::Factory(live), AddonConfig(), opts, &id, &err));
        assert(m.ListAddons()[0].version == "1.0");

        DispatcherOptions o;
        o.executorThreads = 0;
        o.hookTimeout = std::chrono::milliseconds(1000);
        Dispatcher d(&reg, o);
        Verdict v = testaddons::Dispatch(d, EventKind::kRequest, "example.com", "/");
        assert(*FindHeader(v.setHeaders, "X-Example-Version") == "1.0");

        // Held across the swap so the 1.0 mapping stays loaded.
        auto held = SharedLibraryAddon::Open(live, v1Digest, &error);
        assert(held && held->Version() == "1.0");

        copyFile(kLibV2, live);
        assert(m.UpgradeAddon("live", SharedLibraryAddon::Factory(live), &err));
        const std::vector<AddonSummary> list = m.ListAddons();
        assert(list.size() == 1);
        assert(list[0].version == "2.0");
        assert(list[0].fingerprint == v2Digest);
        assert(list[0].state == AddonState::kActive);

        v = testaddons::Dispatch(d, EventKind::kRequest, "example.com", "/");
        assert(*FindHeader(v.setHeaders, "X-Example-Version") == "2.0");
        assert(held->Version() == "1.0");

        // A pin taken from the old build no longer admits the file.
        assert(!SharedLibraryAddon::Open(live, v1Digest, &error));
        assert(error.find("sha256 mismatch") != std::string::npos);

        m.Shutdown();
        std::remove(live.c_str());
    }

    // A pinned digest that does not match refuses the code.
    {
        AddonRegistry reg;
        LifecycleManager m(&reg);
        Error err;
        assert(!install(&m, "pinned", std::string(64, '0'), AddonConfig(), &err));
        assert(err.code == ErrorCode::kAddonInitFailure);
        assert(err.message.find("sha256 mismatch") != std::string::npos);
        assert(m.ListAddons().empty());
    }

    // Init refused by the addon leaves it in Error with the reason recorded.
    {
        AddonRegistry reg;
        LifecycleManager m(&reg);
        Error err;
        AddonConfig cfg;
        cfg.settings["fail_init"] = "1";
        assert(!install(&m, "refuses", "", cfg, &err));
        assert(err.code == ErrorCode::kAddonInitFailure);
        AddonStatus st;
        assert(m.GetAddonState("refuses", &st, &err));
        assert(st.state == AddonState::kError);
        assert(st.lastError.find("init refused by configuration") != std::string::npos);
        assert(reg.Current()->HookCount() == 0);
    }

    // Missing library.
    {
        AddonRegistry reg;
        LifecycleManager m(&reg);
        Error err;
        InstallOptions opts;
        std::string id;
        assert(!m.InstallAddon(SharedLibraryAddon::Factory("/nonexistent/addon.so"), AddonConfig(), opts, &id, &err));
        assert(err.code == ErrorCode::kAddonInitFailure);
    }

    // Configuration-driven install with a hook override.
    {
        Config& conf = Config::Instance();
        conf.Clear();
        const std::string ini = std::string("[addon.example]\n") + "path = " + kLib + "\n" + "sha256 = " + digest +
                                "\n" + "setting.greeting = from-config\n" + "hook.tag.rule = DOMAIN-SUFFIX,example.org\n";
        assert(conf.LoadFromString(ini));

        AddonRegistry reg;
        LifecycleManager m(&reg);
        AddonLoader loader(&m);
        std::vector<Error> errors;
        assert(loader.InstallFromConfig(conf, &errors) == 1);
        assert(errors.empty());

        DispatcherOptions o;
        o.executorThreads = 0;
        o.hookTimeout = std::chrono::milliseconds(1000);
        Dispatcher d(&reg, o);
        Verdict v = testaddons::Dispatch(d, EventKind::kRequest, "www.example.org", "/");
        assert(*FindHeader(v.setHeaders, "X-Example-Addon") == "from-config");
        v = testaddons::Dispatch(d, EventKind::kRequest, "www.example.com", "/");
        assert(v.IsPassThrough());

        m.Shutdown();
        assert(m.ListAddons().empty());
        conf.Clear();
    }
    return 0;
}
