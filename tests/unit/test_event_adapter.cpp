#include "addonhub/core/EventAdapter.h"
#include "addonhub/core/Dispatcher.h"
#include "addonhub/core/LifecycleManager.h"
#include "addonhub/addons/BuiltinAddons.h"
#include "addonhub/common/Logger.h"
#include "TestAddons.h"

#include <cassert>
#include <chrono>
#include <string>
#include <thread>

using addonhub::common::Error;
using addonhub::core::AddonConfig;
using addonhub::core::AddonRegistry;
using addonhub::core::Contribution;
using addonhub::core::Dispatcher;
using addonhub::core::DispatcherOptions;
using addonhub::core::EngineAction;
using addonhub::core::EngineFlow;
using addonhub::core::EngineRequest;
using addonhub::core::EventAdapter;
using addonhub::core::EventKind;
using addonhub::core::FindHeader;
using addonhub::core::InstallOptions;
using addonhub::core::LifecycleManager;
using addonhub::core::TrafficEvent;
using addonhub::core::Verdict;

static EngineFlow flow(const std::string& url) {
    EngineFlow f;
    f.id = "f1";
    f.clientIp = "10.0.0.9";
    f.clientPort = 40000;
    f.serverIp = "1.2.3.4";
    f.request.method = "POST";
    std::string error;
    const bool ok = EventAdapter::ParseUrl(url, &f.request, &error);
    assert(ok);
    f.request.headers = {{"Content-Type", "Application/JSON; charset=utf-8"}, {"X-Remove", "1"}, {"Content-Length", "2"}};
    f.request.body = "{}";
    return f;
}

int main() {
    addonhub::common::Logger::Instance().SetLevel(addonhub::common::LogLevel::FATAL);

    // URL parsing.
    {
        EngineRequest r;
        std::string error;
        assert(EventAdapter::ParseUrl("https://Shop.Example.com:8443/cart?id=1", &r, &error));
        assert(r.scheme == "https" && r.host == "Shop.Example.com" && r.port == 8443);
        assert(r.path == "/cart?id=1");
        assert(EventAdapter::ParseUrl("http://a.com", &r, &error));
        assert(r.port == 80 && r.path == "/");
        assert(!EventAdapter::ParseUrl("a.com/x", &r, &error));
        assert(!EventAdapter::ParseUrl("http://a.com:99999/", &r, &error));
        assert(!EventAdapter::ParseUrl("http:///x", &r, &error));
    }

    // Flow to event: path/query split, content type normalized, per-kind attributes.
    {
        EngineFlow f = flow("https://api.example.com/v1/items?x=1");
        TrafficEvent req = EventAdapter::ToEvent(EventKind::kRequest, f);
        const auto& a = req.attributes();
        assert(req.kind() == EventKind::kRequest);
        assert(req.flowId() == "f1");
        assert(a.host == "api.example.com" && a.port == 443);
        assert(a.path == "/v1/items" && a.query == "x=1");
        assert(a.contentType == "application/json");
        assert(a.body == "{}");
        assert(a.clientIp == "10.0.0.9" && a.clientPort == 40000);

        TrafficEvent hdrs = EventAdapter::ToEvent(EventKind::kRequestHeaders, f);
        assert(hdrs.attributes().body.empty());

        f.hasResponse = true;
        f.response.statusCode = 502;
        f.response.headers = {{"Content-Type", "text/html"}};
        f.response.body = "<h1>bad gateway</h1>";
        TrafficEvent resp = EventAdapter::ToEvent(EventKind::kResponse, f);
        assert(resp.attributes().statusCode == 502);
        assert(resp.attributes().contentType == "text/html");
        assert(resp.attributes().body == f.response.body);

        EngineFlow h;
        h.request.headers = {{"Host", "b.example.org:8080"}};
        TrafficEvent hostHdr = EventAdapter::ToEvent(EventKind::kRequestHeaders, h);
        assert(hostHdr.attributes().host == "b.example.org");
        assert(hostHdr.attributes().port == 8080);

        // Out-of-range or malformed Host ports fall back to the scheme default.
        EngineFlow wrap;
        wrap.request.headers = {{"Host", "a.com:65616"}};
        TrafficEvent wrapped = EventAdapter::ToEvent(EventKind::kRequestHeaders, wrap);
        assert(wrapped.attributes().host == "a.com");
        assert(wrapped.attributes().port == 80);
        wrap.request.headers = {{"Host", "a.com:99999"}};
        assert(EventAdapter::ToEvent(EventKind::kRequestHeaders, wrap).attributes().port == 80);
        wrap.request.headers = {{"Host", "a.com:0"}};
        assert(EventAdapter::ToEvent(EventKind::kRequestHeaders, wrap).attributes().port == 80);
        wrap.request.headers = {{"Host", "a.com:80x"}};
        assert(EventAdapter::ToEvent(EventKind::kRequestHeaders, wrap).attributes().port == 80);
    }

    // Applying a modify verdict edits the request and keeps Content-Length in step.
    {
        EngineFlow f = flow("http://a.com/");
        Verdict v;
        Contribution c;
        c.setHeaders = {{"X-Added", "yes"}};
        c.removeHeaders = {"x-remove"};
        c.body = std::string("{\"a\":1}");
        c.annotations = {"rewrote body"};
        v.Merge("rw", c);
        assert(EventAdapter::Apply(EventKind::kRequest, v, &f) == EngineAction::kModified);
        assert(*FindHeader(f.request.headers, "X-Added") == "yes");
        assert(FindHeader(f.request.headers, "X-Remove") == nullptr);
        assert(f.request.body == "{\"a\":1}");
        assert(*FindHeader(f.request.headers, "Content-Length") == "7");
        assert(f.annotations.size() == 1 && f.annotations[0] == "rw: rewrote body");

        Verdict none;
        EngineFlow untouched = flow("http://a.com/");
        assert(EventAdapter::Apply(EventKind::kRequest, none, &untouched) == EngineAction::kContinue);
        assert(untouched.request.body == "{}");
    }

    // Terminal verdicts synthesize the response.
    {
        EngineFlow f = flow("http://a.com/");
        Verdict block;
        block.Merge("guard", Contribution::Block(403, "forbidden"));
        assert(EventAdapter::Apply(EventKind::kRequestHeaders, block, &f) == EngineAction::kBlock);
        assert(f.hasResponse);
        assert(f.response.statusCode == 403);
        assert(f.response.body.find("guard") != std::string::npos);
        assert(*FindHeader(f.response.headers, "Content-Length") == std::to_string(f.response.body.size()));

        EngineFlow g = flow("http://a.com/");
        Verdict respond;
        respond.Merge("mock", Contribution::Respond(200, "{\"mock\":true}", {{"Content-Type", "application/json"}}));
        assert(EventAdapter::Apply(EventKind::kRequest, respond, &g) == EngineAction::kRespond);
        assert(g.response.statusCode == 200);
        assert(g.response.body == "{\"mock\":true}");
        assert(*FindHeader(g.response.headers, "Content-Type") == "application/json");

        EngineFlow ws = flow("wss://a.com/chat");
        assert(EventAdapter::Apply(EventKind::kWebSocketMessage, block, &ws) == EngineAction::kBlock);
        assert(ws.wsDropped && !ws.hasResponse);

        EngineFlow tls = flow("https://a.com/");
        assert(EventAdapter::Apply(EventKind::kTlsEstablished, block, &tls) == EngineAction::kBlock);
        assert(tls.killed);
    }

    // End to end through the dispatcher with the built-in addons.
    {
        AddonRegistry reg;
        LifecycleManager m(&reg);
        std::string id;
        Error err;
        InstallOptions opts;
        opts.enable = true;

        AddonConfig block;
        block.settings["hosts"] = "+.ads.net";
        const auto builtins = addonhub::addons::BuiltinFactories();
        assert(m.InstallAddon(builtins.at("blocklist"), block, opts, &id, &err));

        AddonConfig inject;
        inject.settings["request.X-Via"] = "addonhub";
        inject.settings["response.X-Seen"] = "1";
        assert(m.InstallAddon(builtins.at("header_injector"), inject, opts, &id, &err));

        DispatcherOptions o;
        o.executorThreads = 0;
        Dispatcher d(&reg, o);
        EventAdapter adapter(&d, std::chrono::milliseconds(100));

        EngineFlow ad = flow("http://cdn.ads.net/pixel");
        assert(adapter.OnRequestHeaders(ad) == EngineAction::kBlock);
        assert(ad.response.statusCode == 403);
        assert(FindHeader(ad.request.headers, "X-Via") == nullptr);

        EngineFlow ok = flow("http://www.example.com/");
        assert(adapter.OnRequestHeaders(ok) == EngineAction::kModified);
        assert(*FindHeader(ok.request.headers, "X-Via") == "addonhub");

        ok.hasResponse = true;
        ok.response.statusCode = 200;
        assert(adapter.OnResponseHeaders(ok) == EngineAction::kModified);
        assert(*FindHeader(ok.response.headers, "X-Seen") == "1");

        assert(adapter.OnRequest(ok) == EngineAction::kContinue);
        assert(adapter.OnConnectionClosed(ok) == EngineAction::kContinue);
        assert(adapter.OnError(ok) == EngineAction::kContinue);
    }

    // A blocking hook cannot hold the engine past the reaction budget.
    {
        AddonRegistry reg;
        LifecycleManager m(&reg);
        testaddons::Script s;
        s.name = "lookup";
        s.hooks = {testaddons::Hook("remote", EventKind::kRequestHeaders, "", 0, false, true)};
        s.handler = [](const std::string&, const TrafficEvent&, Contribution* out, std::string*) {
            std::this_thread::sleep_for(std::chrono::milliseconds(400));
            out->setHeaders.push_back({"X-Late", "1"});
            return true;
        };
        std::string id;
        Error err;
        InstallOptions opts;
        opts.enable = true;
        assert(m.InstallAddon(testaddons::Factory(s), AddonConfig(), opts, &id, &err));

        DispatcherOptions o;
        o.executorThreads = 1;
        o.hookTimeout = std::chrono::milliseconds(150);
        o.failureThreshold = 0;
        Dispatcher d(&reg, o);
        EventAdapter adapter(&d, std::chrono::milliseconds(10));

        EngineFlow f = flow("http://a.com/");
        const auto start = std::chrono::steady_clock::now();
        assert(adapter.OnRequestHeaders(f) == EngineAction::kContinue);
        assert(std::chrono::steady_clock::now() - start < std::chrono::milliseconds(100));
        assert(FindHeader(f.request.headers, "X-Late") == nullptr);
        assert(d.stats().timeouts() + d.stats().expired() == 1);
    }
    return 0;
}
