#pragma once

#include <stddef.h>

#ifdef __cplusplus
extern "C" {
#endif

// Stable C ABI for addons shipped as shared libraries. The host never exposes C++ types
// across it: events are flat structs and results are reported through host callbacks.

#define ADDONHUB_ADDON_API_VERSION 1
#define ADDONHUB_ADDON_GET_SYMBOL "addonhub_addon_get_v1"

enum addonhub_log_level {
    ADDONHUB_LOG_DEBUG = 0,
    ADDONHUB_LOG_INFO = 1,
    ADDONHUB_LOG_WARN = 2,
    ADDONHUB_LOG_ERROR = 3,
};

// Same order as the host's event kinds.
enum addonhub_event_kind {
    ADDONHUB_EVENT_REQUEST_HEADERS = 0,
    ADDONHUB_EVENT_REQUEST = 1,
    ADDONHUB_EVENT_RESPONSE_HEADERS = 2,
    ADDONHUB_EVENT_RESPONSE = 3,
    ADDONHUB_EVENT_TLS_ESTABLISHED = 4,
    ADDONHUB_EVENT_WEBSOCKET_MESSAGE = 5,
    ADDONHUB_EVENT_CONNECTION_CLOSED = 6,
    ADDONHUB_EVENT_ERROR = 7,
};

typedef struct addonhub_host_v1 {
    int api_version;  // must be ADDONHUB_ADDON_API_VERSION
    void* host_ctx;
    void (*log)(void* host_ctx, int level, const char* msg);
} addonhub_host_v1;

typedef struct addonhub_header_v1 {
    const char* name;
    const char* value;
} addonhub_header_v1;

// Valid only for the duration of one on_hook call. Strings are never NULL.
typedef struct addonhub_event_v1 {
    int kind;
    const char* flow_id;
    const char* method;
    const char* scheme;
    const char* host;
    int port;
    const char* path;
    const char* query;
    const char* content_type;
    const addonhub_header_v1* headers;
    size_t header_count;
    const char* body;
    size_t body_len;
    int status_code;
    const char* client_ip;
    int client_port;
    const char* server_ip;
    const char* tls_sni;
    const char* tls_version;
    const char* ws_message;
    size_t ws_message_len;
    int ws_from_client;
    const char* error_message;
} addonhub_event_v1;

// Builder for one hook's contribution. Every setter copies its arguments.
typedef struct addonhub_result_v1 {
    void* opaque;
    void (*set_header)(void* opaque, const char* name, const char* value);
    void (*remove_header)(void* opaque, const char* name);
    void (*replace_body)(void* opaque, const char* data, size_t len);
    void (*block)(void* opaque, int status, const char* reason);
    void (*respond)(void* opaque, int status, const char* body, size_t len);
    void (*respond_header)(void* opaque, const char* name, const char* value);
    void (*annotate)(void* opaque, const char* text);
} addonhub_result_v1;

typedef struct addonhub_hook_decl_v1 {
    const char* name;
    const char* event;  // textual event kind, e.g. "request"
    const char* rule;   // may be NULL or "" for every event of the kind
    int priority;
    int short_circuit;
    int blocking;
} addonhub_hook_decl_v1;

typedef struct addonhub_addon_v1 {
    int api_version;  // must be ADDONHUB_ADDON_API_VERSION
    const char* name;
    const char* version;
    const addonhub_hook_decl_v1* hooks;
    size_t hook_count;
    // `settings` is "key=value" lines. Returns the per-instance context, or NULL after
    // writing a message into err.
    void* (*create)(const addonhub_host_v1* host, const char* settings, char* err, size_t err_len);
    void (*destroy)(void* ctx);
    // Return 0 on success; anything else is a runtime failure described in err.
    int (*on_hook)(void* ctx, const char* hook, const addonhub_event_v1* event, const addonhub_result_v1* result,
                   char* err, size_t err_len);
} addonhub_addon_v1;

typedef const addonhub_addon_v1* (*addonhub_addon_get_v1_fn)(void);

#ifdef __cplusplus
}
#endif
