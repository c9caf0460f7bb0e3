#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace addonhub {
namespace core {

enum class EventKind {
    kRequestHeaders = 0,
    kRequest,
    kResponseHeaders,
    kResponse,
    kTlsEstablished,
    kWebSocketMessage,
    kConnectionClosed,
    kError,
};

constexpr size_t kEventKindCount = 8;

const char* EventKindName(EventKind kind);
bool ParseEventKind(const std::string& name, EventKind* out);
inline size_t EventKindIndex(EventKind kind) { return static_cast<size_t>(kind); }

struct Header {
    std::string name;
    std::string value;
};
using HeaderList = std::vector<Header>;

bool IEquals(const std::string& a, const std::string& b);
const std::string* FindHeader(const HeaderList& headers, const std::string& name);
void SetHeader(HeaderList* headers, const std::string& name, const std::string& value);
void RemoveHeader(HeaderList* headers, const std::string& name);

// What the proxy engine reported about one occurrence. Read-only once the event is built.
// `headers` holds request headers for request kinds and response headers for response kinds.
struct EventAttributes {
    std::string method;
    std::string scheme;
    std::string host;
    uint16_t port{0};
    std::string path;
    std::string query;
    std::string contentType;
    HeaderList headers;
    std::string body;

    int statusCode{0};

    std::string clientIp;
    uint16_t clientPort{0};
    std::string serverIp;

    std::string tlsSni;
    std::string tlsVersion;

    std::string wsMessage;
    bool wsFromClient{false};

    std::string errorMessage;
};

enum class TerminalAction { kNone, kBlock, kRespond };

// Output of one hook invocation.
struct Contribution {
    HeaderList setHeaders;
    std::vector<std::string> removeHeaders;
    std::optional<std::string> body;

    TerminalAction terminal{TerminalAction::kNone};
    int status{0};
    std::string reason;
    HeaderList responseHeaders;
    std::string responseBody;

    std::vector<std::string> annotations;

    bool IsTerminal() const { return terminal != TerminalAction::kNone; }
    bool Empty() const;

    static Contribution Block(int status, const std::string& reason);
    static Contribution Respond(int status, const std::string& body, HeaderList headers = HeaderList());
};

// Accumulated decision for one event, merged in invocation order.
struct Verdict {
    enum class Action { kContinue, kModify, kBlock, kRespond };

    Action action{Action::kContinue};
    HeaderList setHeaders;
    std::vector<std::string> removeHeaders;
    std::optional<std::string> body;

    int status{0};
    std::string reason;
    HeaderList responseHeaders;
    std::string responseBody;
    std::string terminalAddon;

    std::vector<std::string> annotations;
    // Addon ids whose hooks contributed, in invocation order (repeats allowed).
    std::vector<std::string> contributors;

    bool IsTerminal() const { return action == Action::kBlock || action == Action::kRespond; }
    bool IsPassThrough() const { return action == Action::kContinue; }

    // Header edits accumulate with later writers overriding earlier ones; the body is last
    // writer wins; the first terminal action is kept.
    void Merge(const std::string& addonId, const Contribution& c);
};

const char* VerdictActionName(Verdict::Action action);

class TrafficEvent {
public:
    TrafficEvent(EventKind kind, std::string flowId, EventAttributes attrs);

    EventKind kind() const { return kind_; }
    const std::string& flowId() const { return flowId_; }
    const EventAttributes& attributes() const { return *attrs_; }

    const Verdict& verdict() const { return verdict_; }
    Verdict* mutable_verdict() { return &verdict_; }

private:
    EventKind kind_;
    std::string flowId_;
    // Shared so a copy handed to a background hook stays valid after the cycle ends.
    std::shared_ptr<const EventAttributes> attrs_;
    Verdict verdict_;
};

} // namespace core
} // namespace addonhub
