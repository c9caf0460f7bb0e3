#include "addonhub/core/EventAdapter.h"
#include "addonhub/common/Config.h"
#include "addonhub/common/Logger.h"
#include "addonhub/core/Dispatcher.h"

#include <algorithm>
#include <cctype>

namespace addonhub {
namespace core {

namespace {

bool IsRequestSide(EventKind kind) {
    return kind == EventKind::kRequestHeaders || kind == EventKind::kRequest;
}

bool IsResponseSide(EventKind kind) {
    return kind == EventKind::kResponseHeaders || kind == EventKind::kResponse;
}

std::string Lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return std::tolower(c); });
    return s;
}

uint16_t DefaultPort(const std::string& scheme) {
    return (scheme == "https" || scheme == "wss") ? 443 : 80;
}

void ApplyHeaderEdits(const Verdict& v, HeaderList* headers) {
    for (const auto& name : v.removeHeaders) RemoveHeader(headers, name);
    for (const auto& h : v.setHeaders) SetHeader(headers, h.name, h.value);
}

void SetContentLength(HeaderList* headers, size_t n) {
    if (FindHeader(*headers, "Content-Length")) SetHeader(headers, "Content-Length", std::to_string(n));
}

} // namespace

const char* EngineActionName(EngineAction action) {
    switch (action) {
        case EngineAction::kContinue: return "continue";
        case EngineAction::kModified: return "modified";
        case EngineAction::kBlock: return "block";
        case EngineAction::kRespond: return "respond";
    }
    return "unknown";
}

EventAdapter::EventAdapter(Dispatcher* dispatcher, std::chrono::milliseconds reactionBudget)
    : dispatcher_(dispatcher), reactionBudget_(reactionBudget) {}

EngineAction EventAdapter::OnRequestHeaders(EngineFlow& flow) { return On(EventKind::kRequestHeaders, flow); }
EngineAction EventAdapter::OnRequest(EngineFlow& flow) { return On(EventKind::kRequest, flow); }
EngineAction EventAdapter::OnResponseHeaders(EngineFlow& flow) { return On(EventKind::kResponseHeaders, flow); }
EngineAction EventAdapter::OnResponse(EngineFlow& flow) { return On(EventKind::kResponse, flow); }
EngineAction EventAdapter::OnTlsEstablished(EngineFlow& flow) { return On(EventKind::kTlsEstablished, flow); }
EngineAction EventAdapter::OnWebSocketMessage(EngineFlow& flow) { return On(EventKind::kWebSocketMessage, flow); }
EngineAction EventAdapter::OnConnectionClosed(EngineFlow& flow) { return On(EventKind::kConnectionClosed, flow); }
EngineAction EventAdapter::OnError(EngineFlow& flow) { return On(EventKind::kError, flow); }

EngineAction EventAdapter::On(EventKind kind, EngineFlow& flow) {
    TrafficEvent event = ToEvent(kind, flow);
    Verdict verdict;
    if (reactionBudget_.count() > 0) {
        verdict = dispatcher_->Handle(event, Dispatcher::Clock::now() + reactionBudget_);
    } else {
        verdict = dispatcher_->Handle(event);
    }
    EngineAction action = Apply(kind, verdict, &flow);
    if (action != EngineAction::kContinue) {
        LOG_DEBUG << "Flow " << flow.id << " " << EventKindName(kind) << ": " << EngineActionName(action);
    }
    return action;
}

TrafficEvent EventAdapter::ToEvent(EventKind kind, const EngineFlow& flow) {
    EventAttributes a;
    const EngineRequest& req = flow.request;
    a.method = req.method;
    a.scheme = req.scheme;
    a.host = req.host;
    if (a.host.empty()) {
        const std::string* h = FindHeader(req.headers, "Host");
        if (h) a.host = *h;
    }
    // Host header may carry the port.
    size_t colon = a.host.rfind(':');
    if (colon != std::string::npos && a.host.find(']') == std::string::npos) {
        long p = 0;
        if (req.port == 0 && common::Config::ParseInt(a.host.substr(colon + 1), &p) && p >= 1 && p <= 65535) {
            a.port = static_cast<uint16_t>(p);
        }
        a.host.erase(colon);
    }
    if (a.port == 0) a.port = req.port ? req.port : DefaultPort(req.scheme);

    size_t q = req.path.find('?');
    a.path = req.path.substr(0, q);
    if (q != std::string::npos) a.query = req.path.substr(q + 1);

    a.clientIp = flow.clientIp;
    a.clientPort = flow.clientPort;
    a.serverIp = flow.serverIp;
    a.tlsSni = flow.tlsSni;
    a.tlsVersion = flow.tlsVersion;
    a.errorMessage = flow.errorMessage;

    if (IsResponseSide(kind) && flow.hasResponse) {
        a.headers = flow.response.headers;
        a.statusCode = flow.response.statusCode;
        if (kind == EventKind::kResponse) a.body = flow.response.body;
    } else {
        a.headers = req.headers;
        if (kind == EventKind::kRequest) a.body = req.body;
        if (flow.hasResponse) a.statusCode = flow.response.statusCode;
    }
    const std::string* ct = FindHeader(a.headers, "Content-Type");
    if (ct) a.contentType = Lower(common::Config::Trim(ct->substr(0, ct->find(';'))));

    if (kind == EventKind::kWebSocketMessage) {
        a.wsMessage = flow.wsMessage;
        a.wsFromClient = flow.wsFromClient;
    }
    return TrafficEvent(kind, flow.id, std::move(a));
}

EngineAction EventAdapter::Apply(EventKind kind, const Verdict& v, EngineFlow* flow) {
    for (const auto& a : v.annotations) flow->annotations.push_back(a);

    if (v.IsTerminal()) {
        if (IsRequestSide(kind) || IsResponseSide(kind)) {
            EngineResponse resp;
            if (v.action == Verdict::Action::kBlock) {
                resp.statusCode = v.status ? v.status : 403;
                resp.reason = v.reason.empty() ? "Blocked" : v.reason;
                resp.headers = {{"Content-Type", "text/plain"}};
                resp.body = "Blocked by " + v.terminalAddon;
                if (!v.reason.empty()) resp.body += ": " + v.reason;
                resp.body += "\n";
            } else {
                resp.statusCode = v.status ? v.status : 200;
                resp.reason = v.reason;
                resp.headers = v.responseHeaders;
                resp.body = v.responseBody;
            }
            SetHeader(&resp.headers, "Content-Length", std::to_string(resp.body.size()));
            flow->response = std::move(resp);
            flow->hasResponse = true;
        } else if (kind == EventKind::kWebSocketMessage) {
            flow->wsDropped = true;
        } else {
            flow->killed = true;
        }
        return v.action == Verdict::Action::kBlock ? EngineAction::kBlock : EngineAction::kRespond;
    }
    if (v.action != Verdict::Action::kModify) return EngineAction::kContinue;

    if (IsRequestSide(kind)) {
        ApplyHeaderEdits(v, &flow->request.headers);
        if (v.body) {
            flow->request.body = *v.body;
            SetContentLength(&flow->request.headers, v.body->size());
        }
    } else if (IsResponseSide(kind) && flow->hasResponse) {
        ApplyHeaderEdits(v, &flow->response.headers);
        if (v.body) {
            flow->response.body = *v.body;
            SetContentLength(&flow->response.headers, v.body->size());
        }
    } else if (kind == EventKind::kWebSocketMessage) {
        if (v.body) flow->wsMessage = *v.body;
    } else {
        // Nothing editable on this occurrence.
        return EngineAction::kContinue;
    }
    return EngineAction::kModified;
}

bool EventAdapter::ParseUrl(const std::string& url, EngineRequest* req, std::string* error) {
    size_t sep = url.find("://");
    if (sep == std::string::npos || sep == 0) {
        if (error) *error = "missing scheme in url: " + url;
        return false;
    }
    std::string scheme = Lower(url.substr(0, sep));
    std::string rest = url.substr(sep + 3);
    size_t slash = rest.find('/');
    std::string authority = rest.substr(0, slash);
    std::string path = slash == std::string::npos ? "/" : rest.substr(slash);
    if (authority.empty()) {
        if (error) *error = "missing host in url: " + url;
        return false;
    }

    uint16_t port = DefaultPort(scheme);
    size_t colon = authority.rfind(':');
    if (colon != std::string::npos) {
        long p = 0;
        if (!common::Config::ParseInt(authority.substr(colon + 1), &p) || p <= 0 || p > 65535) {
            if (error) *error = "bad port in url: " + url;
            return false;
        }
        port = static_cast<uint16_t>(p);
        authority.erase(colon);
    }
    req->scheme = scheme;
    req->host = authority;
    req->port = port;
    req->path = path;
    return true;
}

} // namespace core
} // namespace addonhub
