#include "addonhub/addons/BuiltinAddons.h"
#include "addonhub/common/Config.h"
#include "addonhub/common/Logger.h"
#include "addonhub/core/AddonLoader.h"
#include "addonhub/core/AddonRegistry.h"
#include "addonhub/core/Dispatcher.h"
#include "addonhub/core/EventAdapter.h"
#include "addonhub/core/LifecycleManager.h"
#include "addonhub/monitor/AuditLogger.h"

#include <getopt.h>
#include <unistd.h>

#include <chrono>
#include <cstdint>
#include <cstdio>
#include <fstream>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

namespace {

using namespace addonhub;

// One replay line:
//   <event> <METHOD> <url> [| Header: value]... [| body=...] [| status=200] [| client=ip:port]
// Response-side events put headers and body on the response.
bool ParseReplayLine(const std::string& line, size_t lineNo, core::EventKind* kind, core::EngineFlow* flow,
                     std::string* error) {
    std::vector<std::string> parts;
    std::string cur;
    std::istringstream in(line);
    while (std::getline(in, cur, '|')) parts.push_back(common::Config::Trim(cur));
    if (parts.empty()) {
        *error = "empty line";
        return false;
    }

    std::istringstream head(parts[0]);
    std::string kindName, method, url;
    head >> kindName >> method >> url;
    if (!core::ParseEventKind(kindName, kind)) {
        *error = "unknown event '" + kindName + "'";
        return false;
    }
    flow->id = "flow-" + std::to_string(lineNo);
    flow->request.method = method;
    if (!url.empty() && !core::EventAdapter::ParseUrl(url, &flow->request, error)) return false;

    const bool responseSide = *kind == core::EventKind::kResponseHeaders || *kind == core::EventKind::kResponse;
    if (responseSide) {
        flow->hasResponse = true;
        flow->response.statusCode = 200;
    }
    for (size_t i = 1; i < parts.size(); ++i) {
        const std::string& p = parts[i];
        if (p.compare(0, 5, "body=") == 0) {
            (responseSide ? flow->response.body : flow->request.body) = p.substr(5);
            flow->wsMessage = p.substr(5);
        } else if (p.compare(0, 7, "status=") == 0) {
            long v = 0;
            if (!common::Config::ParseInt(p.substr(7), &v)) {
                *error = "bad status '" + p + "'";
                return false;
            }
            flow->hasResponse = true;
            flow->response.statusCode = static_cast<int>(v);
        } else if (p.compare(0, 7, "client=") == 0) {
            const std::string addr = p.substr(7);
            const size_t colon = addr.rfind(':');
            flow->clientIp = addr.substr(0, colon);
            long port = 0;
            if (colon != std::string::npos && common::Config::ParseInt(addr.substr(colon + 1), &port)) {
                flow->clientPort = static_cast<uint16_t>(port);
            }
        } else if (p.compare(0, 4, "sni=") == 0) {
            flow->tlsSni = p.substr(4);
        } else if (p.compare(0, 6, "error=") == 0) {
            flow->errorMessage = p.substr(6);
        } else {
            const size_t colon = p.find(':');
            if (colon == std::string::npos) {
                *error = "expected 'Header: value', got '" + p + "'";
                return false;
            }
            core::HeaderList& headers = responseSide ? flow->response.headers : flow->request.headers;
            headers.push_back({common::Config::Trim(p.substr(0, colon)), common::Config::Trim(p.substr(colon + 1))});
        }
    }
    return true;
}

void PrintFlow(const core::EngineFlow& flow, core::EventKind kind, core::EngineAction action) {
    printf("%s %s %s%s -> %s", flow.id.c_str(), core::EventKindName(kind), flow.request.host.c_str(),
           flow.request.path.c_str(), core::EngineActionName(action));
    if (action == core::EngineAction::kBlock || action == core::EngineAction::kRespond) {
        printf(" %d", flow.response.statusCode);
    }
    printf("\n");
    const bool responseSide = kind == core::EventKind::kResponseHeaders || kind == core::EventKind::kResponse;
    if (action == core::EngineAction::kModified) {
        const core::HeaderList& headers = responseSide ? flow.response.headers : flow.request.headers;
        for (const auto& h : headers) printf("    %s: %s\n", h.name.c_str(), h.value.c_str());
    }
    for (const auto& a : flow.annotations) printf("    # %s\n", a.c_str());
}

int Replay(const std::string& file, core::EventAdapter* adapter) {
    std::ifstream in(file);
    if (!in) {
        LOG_ERROR << "Cannot open replay file " << file;
        return 1;
    }
    std::string line;
    size_t lineNo = 0;
    int bad = 0;
    while (std::getline(in, line)) {
        ++lineNo;
        line = common::Config::Trim(line);
        if (line.empty() || line[0] == '#') continue;
        core::EventKind kind;
        core::EngineFlow flow;
        std::string error;
        if (!ParseReplayLine(line, lineNo, &kind, &flow, &error)) {
            LOG_WARN << file << ":" << lineNo << ": " << error;
            ++bad;
            continue;
        }
        PrintFlow(flow, kind, adapter->On(kind, flow));
    }
    return bad == 0 ? 0 : 1;
}

void PrintAddons(const core::LifecycleManager& manager) {
    for (const auto& a : manager.ListAddons()) {
        printf("addon %s (%s %s) %s hooks=%zu invocations=%lld failures=%lld", a.id.c_str(), a.name.c_str(),
               a.version.c_str(), core::AddonStateName(a.state), a.hookCount, a.invocations, a.failures);
        if (!a.lastError.empty()) printf(" error=\"%s\"", a.lastError.c_str());
        printf("\n");
    }
    for (const auto& h : manager.DescribeHooks()) {
        printf("  hook %s/%s %s priority=%d%s%s rule=\"%s\"\n", h.addonId.c_str(), h.hookName.c_str(),
               core::EventKindName(h.kind), h.priority, h.shortCircuit ? " short_circuit" : "",
               h.blocking ? " blocking" : "", h.rule.c_str());
    }
}

} // namespace

int main(int argc, char* argv[]) {
    using namespace addonhub;

    std::string configFile = "../config/addonhub.conf";
    std::string replayFile;
    bool checkOnly = false;
    bool listOnly = false;
    int ch;
    while ((ch = getopt(argc, argv, "c:r:hCl")) != -1) {
        switch (ch) {
            case 'c':
                configFile = optarg;
                break;
            case 'r':
                replayFile = optarg;
                break;
            case 'C':
                checkOnly = true;
                break;
            case 'l':
                listOnly = true;
                break;
            case 'h':
            default:
                printf("Usage: %s [-c config_file] [-C] [-l] [-r replay_file]\n", argv[0]);
                printf("  -C  check config and exit\n");
                printf("  -l  install configured addons, list them and exit\n");
                printf("  -r  replay a traffic script through the dispatcher\n");
                return 0;
        }
    }

    auto& conf = common::Config::Instance();
    if (!conf.Load(configFile)) {
        LOG_ERROR << "Failed to load config " << configFile << ", using defaults.";
    }
    auto& logger = common::Logger::Instance();
    logger.SetLevel(logger.ParseLevel(conf.GetString("global", "log_level", "INFO")));

    if (checkOnly) {
        std::vector<common::Error> errors;
        if (!core::AddonLoader::CheckConfig(conf, &errors)) {
            for (const auto& e : errors) fprintf(stderr, "%s\n", e.ToString().c_str());
            return 1;
        }
        printf("OK\n");
        return 0;
    }

    std::unique_ptr<monitor::AuditLogger> audit;
    const std::string auditPath = conf.GetString("global", "audit_log", "");
    if (!auditPath.empty()) {
        audit = std::make_unique<monitor::AuditLogger>(auditPath);
        if (!audit->ok()) {
            LOG_ERROR << "Audit log disabled: cannot open " << auditPath;
            audit.reset();
        }
    }

    core::AddonRegistry registry;
    core::LifecycleManager manager(&registry, audit.get());
    core::Dispatcher dispatcher(&registry, core::DispatcherOptions::FromConfig(conf));
    dispatcher.SetQuarantineHandler(
        [&manager](const std::string& id, std::uint64_t serial, const std::string& reason) {
            manager.Quarantine(id, serial, reason);
        });

    core::AddonLoader loader(&manager);
    for (auto& kv : addons::BuiltinFactories()) loader.RegisterBuiltin(kv.first, std::move(kv.second));

    std::vector<common::Error> errors;
    const size_t installed = loader.InstallFromConfig(conf, &errors);
    LOG_INFO << "Installed " << installed << " addon(s), " << errors.size() << " rejected";

    int rc = errors.empty() ? 0 : 1;
    if (!listOnly && !replayFile.empty()) {
        core::EventAdapter adapter(&dispatcher,
                                   std::chrono::milliseconds(conf.GetInt("dispatcher", "reaction_budget_ms", 0)));
        if (Replay(replayFile, &adapter) != 0) rc = 1;
        printf("%s\n", dispatcher.stats().ToJson().c_str());
    }
    PrintAddons(manager);

    manager.Shutdown();
    return rc;
}
