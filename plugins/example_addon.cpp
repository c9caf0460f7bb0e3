#include "addonhub/common/AddonApi.h"

#include <cstdio>
#include <cstring>
#include <new>
#include <sstream>
#include <string>

#ifndef EXAMPLE_ADDON_VERSION
#define EXAMPLE_ADDON_VERSION "1.0"
#endif

namespace {

struct ExampleCtx {
    addonhub_host_v1 host{};
    std::string greeting{"hello"};
};

void Log(const ExampleCtx* ctx, int level, const std::string& msg) {
    if (ctx->host.log) ctx->host.log(ctx->host.host_ctx, level, msg.c_str());
}

void* Create(const addonhub_host_v1* host, const char* settings, char* err, size_t errLen) {
    if (!host || host->api_version != ADDONHUB_ADDON_API_VERSION) {
        std::snprintf(err, errLen, "unsupported host api");
        return nullptr;
    }
    ExampleCtx* ctx = new (std::nothrow) ExampleCtx();
    if (!ctx) {
        std::snprintf(err, errLen, "out of memory");
        return nullptr;
    }
    ctx->host = *host;

    std::istringstream in(settings ? settings : "");
    std::string line;
    while (std::getline(in, line)) {
        const size_t eq = line.find('=');
        if (eq == std::string::npos) continue;
        const std::string key = line.substr(0, eq);
        const std::string value = line.substr(eq + 1);
        if (key == "greeting") {
            ctx->greeting = value;
        } else if (key == "fail_init") {
            std::snprintf(err, errLen, "init refused by configuration");
            delete ctx;
            return nullptr;
        }
    }
    Log(ctx, ADDONHUB_LOG_INFO, "example_addon " EXAMPLE_ADDON_VERSION " ready");
    return ctx;
}

void Destroy(void* p) {
    ExampleCtx* ctx = static_cast<ExampleCtx*>(p);
    if (!ctx) return;
    Log(ctx, ADDONHUB_LOG_INFO, "example_addon shutdown");
    delete ctx;
}

int OnHook(void* p, const char* hook, const addonhub_event_v1* ev, const addonhub_result_v1* out, char* err,
           size_t errLen) {
    ExampleCtx* ctx = static_cast<ExampleCtx*>(p);
    if (!ctx || !hook || !ev || !out) return 1;

    if (std::strcmp(hook, "tag") == 0) {
        out->set_header(out->opaque, "X-Example-Addon", ctx->greeting.c_str());
        out->set_header(out->opaque, "X-Example-Version", EXAMPLE_ADDON_VERSION);
        return 0;
    }
    if (std::strcmp(hook, "deny") == 0) {
        out->block(out->opaque, 403, "admin area");
        out->annotate(out->opaque, "denied by example_addon");
        return 0;
    }
    if (std::strcmp(hook, "fail") == 0) {
        std::snprintf(err, errLen, "simulated failure for %s", ev->path);
        return 1;
    }
    std::snprintf(err, errLen, "unknown hook %s", hook);
    return 1;
}

const addonhub_hook_decl_v1 kHooks[] = {
    {"tag", "request", "", 10, 0, 0},
    {"deny", "requestheaders", "path prefix /admin", 0, 1, 0},
    {"fail", "request", "path prefix /fail", 20, 0, 0},
};

const addonhub_addon_v1 kAddon{
    ADDONHUB_ADDON_API_VERSION,
    "example_addon",
    EXAMPLE_ADDON_VERSION,
    kHooks,
    sizeof(kHooks) / sizeof(kHooks[0]),
    &Create,
    &Destroy,
    &OnHook,
};

} // namespace

extern "C" const addonhub_addon_v1* addonhub_addon_get_v1(void) {
    return &kAddon;
}
