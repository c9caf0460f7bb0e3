#pragma once

#include "addonhub/common/noncopyable.h"
#include "addonhub/core/TrafficEvent.h"

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace addonhub {
namespace core {

class Dispatcher;

// Engine-side view of an HTTP flow. The engine owns it; the adapter only reads it to build
// events and writes verdicts back into it.
struct EngineRequest {
    std::string method;
    std::string scheme{"http"};
    std::string host;
    uint16_t port{0};
    std::string path{"/"};  // may carry "?query"
    HeaderList headers;
    std::string body;
};

struct EngineResponse {
    int statusCode{0};
    std::string reason;
    HeaderList headers;
    std::string body;
};

struct EngineFlow {
    std::string id;
    std::string clientIp;
    uint16_t clientPort{0};
    std::string serverIp;

    EngineRequest request;
    bool hasResponse{false};
    EngineResponse response;

    std::string tlsSni;
    std::string tlsVersion;

    std::string wsMessage;
    bool wsFromClient{true};
    bool wsDropped{false};

    std::string errorMessage;
    // Set when a verdict asks to drop a non-HTTP occurrence.
    bool killed{false};

    std::vector<std::string> annotations;
};

enum class EngineAction { kContinue, kModified, kBlock, kRespond };

const char* EngineActionName(EngineAction action);

// Engine boundary. Each callback builds one TrafficEvent, runs one dispatch cycle and
// applies the verdict to the flow before returning.
class EventAdapter : common::noncopyable {
public:
    // `reactionBudget` bounds each cycle; 0 means unbounded.
    explicit EventAdapter(Dispatcher* dispatcher, std::chrono::milliseconds reactionBudget = std::chrono::milliseconds(0));

    EngineAction OnRequestHeaders(EngineFlow& flow);
    EngineAction OnRequest(EngineFlow& flow);
    EngineAction OnResponseHeaders(EngineFlow& flow);
    EngineAction OnResponse(EngineFlow& flow);
    EngineAction OnTlsEstablished(EngineFlow& flow);
    EngineAction OnWebSocketMessage(EngineFlow& flow);
    EngineAction OnConnectionClosed(EngineFlow& flow);
    EngineAction OnError(EngineFlow& flow);

    EngineAction On(EventKind kind, EngineFlow& flow);

    static TrafficEvent ToEvent(EventKind kind, const EngineFlow& flow);
    static EngineAction Apply(EventKind kind, const Verdict& verdict, EngineFlow* flow);

    // "scheme://host[:port][/path]" into the request line fields.
    static bool ParseUrl(const std::string& url, EngineRequest* req, std::string* error);

private:
    Dispatcher* dispatcher_;
    std::chrono::milliseconds reactionBudget_;
};

} // namespace core
} // namespace addonhub
