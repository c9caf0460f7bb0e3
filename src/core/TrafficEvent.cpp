#include "addonhub/core/TrafficEvent.h"

#include <algorithm>
#include <cctype>
#include <utility>

namespace addonhub {
namespace core {

static const char* const kKindNames[kEventKindCount] = {
    "requestheaders",
    "request",
    "responseheaders",
    "response",
    "tls_established",
    "websocket_message",
    "connection_closed",
    "error",
};

const char* EventKindName(EventKind kind) {
    const size_t idx = EventKindIndex(kind);
    if (idx >= kEventKindCount) return "unknown";
    return kKindNames[idx];
}

bool ParseEventKind(const std::string& name, EventKind* out) {
    if (!out) return false;
    for (size_t i = 0; i < kEventKindCount; ++i) {
        if (IEquals(name, kKindNames[i])) {
            *out = static_cast<EventKind>(i);
            return true;
        }
    }
    // Aliases used by engine callbacks.
    if (IEquals(name, "request_received")) {
        *out = EventKind::kRequest;
        return true;
    }
    if (IEquals(name, "response_received")) {
        *out = EventKind::kResponse;
        return true;
    }
    if (IEquals(name, "websocket")) {
        *out = EventKind::kWebSocketMessage;
        return true;
    }
    return false;
}

bool IEquals(const std::string& a, const std::string& b) {
    if (a.size() != b.size()) return false;
    for (size_t i = 0; i < a.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(a[i])) != std::tolower(static_cast<unsigned char>(b[i]))) {
            return false;
        }
    }
    return true;
}

const std::string* FindHeader(const HeaderList& headers, const std::string& name) {
    for (const auto& h : headers) {
        if (IEquals(h.name, name)) return &h.value;
    }
    return nullptr;
}

void SetHeader(HeaderList* headers, const std::string& name, const std::string& value) {
    if (!headers) return;
    RemoveHeader(headers, name);
    headers->push_back(Header{name, value});
}

void RemoveHeader(HeaderList* headers, const std::string& name) {
    if (!headers) return;
    headers->erase(std::remove_if(headers->begin(), headers->end(),
                                  [&](const Header& h) { return IEquals(h.name, name); }),
                   headers->end());
}

bool Contribution::Empty() const {
    return setHeaders.empty() && removeHeaders.empty() && !body.has_value() && !IsTerminal() && annotations.empty();
}

Contribution Contribution::Block(int status, const std::string& reason) {
    Contribution c;
    c.terminal = TerminalAction::kBlock;
    c.status = status;
    c.reason = reason;
    return c;
}

Contribution Contribution::Respond(int status, const std::string& body, HeaderList headers) {
    Contribution c;
    c.terminal = TerminalAction::kRespond;
    c.status = status;
    c.responseBody = body;
    c.responseHeaders = std::move(headers);
    return c;
}

void Verdict::Merge(const std::string& addonId, const Contribution& c) {
    if (c.Empty()) return;
    contributors.push_back(addonId);

    for (const auto& h : c.setHeaders) {
        SetHeader(&setHeaders, h.name, h.value);
        removeHeaders.erase(std::remove_if(removeHeaders.begin(), removeHeaders.end(),
                                           [&](const std::string& n) { return IEquals(n, h.name); }),
                            removeHeaders.end());
    }
    for (const auto& name : c.removeHeaders) {
        RemoveHeader(&setHeaders, name);
        const bool present = std::any_of(removeHeaders.begin(), removeHeaders.end(),
                                         [&](const std::string& n) { return IEquals(n, name); });
        if (!present) removeHeaders.push_back(name);
    }
    if (c.body) body = c.body;
    for (const auto& a : c.annotations) {
        annotations.push_back(addonId + ": " + a);
    }

    if (c.IsTerminal() && !IsTerminal()) {
        action = (c.terminal == TerminalAction::kBlock) ? Action::kBlock : Action::kRespond;
        status = c.status;
        reason = c.reason;
        responseHeaders = c.responseHeaders;
        responseBody = c.responseBody;
        terminalAddon = addonId;
        return;
    }
    if (action == Action::kContinue && (!setHeaders.empty() || !removeHeaders.empty() || body.has_value())) {
        action = Action::kModify;
    }
}

const char* VerdictActionName(Verdict::Action action) {
    switch (action) {
        case Verdict::Action::kContinue: return "continue";
        case Verdict::Action::kModify: return "modify";
        case Verdict::Action::kBlock: return "block";
        case Verdict::Action::kRespond: return "respond";
    }
    return "unknown";
}

TrafficEvent::TrafficEvent(EventKind kind, std::string flowId, EventAttributes attrs)
    : kind_(kind),
      flowId_(std::move(flowId)),
      attrs_(std::make_shared<const EventAttributes>(std::move(attrs))) {}

} // namespace core
} // namespace addonhub
