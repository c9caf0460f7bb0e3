#include "addonhub/core/SharedLibraryAddon.h"
#include "addonhub/common/Logger.h"

#include <dlfcn.h>
#include <openssl/evp.h>
#include <sys/stat.h>
#include <unistd.h>

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <iterator>
#include <sstream>
#include <utility>

namespace addonhub {
namespace core {

namespace {

const char* OrEmpty(const std::string& s) { return s.c_str(); }

std::string DlError() {
    const char* e = ::dlerror();
    return e ? e : "unknown dlopen error";
}

std::string Lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return std::tolower(c); });
    return s;
}

// Result callbacks write straight into the Contribution.
Contribution* Out(void* opaque) { return static_cast<Contribution*>(opaque); }

void ResultSetHeader(void* opaque, const char* name, const char* value) {
    if (!name) return;
    SetHeader(&Out(opaque)->setHeaders, name, value ? value : "");
}

void ResultRemoveHeader(void* opaque, const char* name) {
    if (name) Out(opaque)->removeHeaders.push_back(name);
}

void ResultReplaceBody(void* opaque, const char* data, size_t len) {
    Out(opaque)->body = std::string(data ? data : "", data ? len : 0);
}

void ResultBlock(void* opaque, int status, const char* reason) {
    Contribution* c = Out(opaque);
    c->terminal = TerminalAction::kBlock;
    c->status = status;
    c->reason = reason ? reason : "";
}

void ResultRespond(void* opaque, int status, const char* body, size_t len) {
    Contribution* c = Out(opaque);
    c->terminal = TerminalAction::kRespond;
    c->status = status;
    c->responseBody.assign(body ? body : "", body ? len : 0);
}

void ResultRespondHeader(void* opaque, const char* name, const char* value) {
    if (!name) return;
    SetHeader(&Out(opaque)->responseHeaders, name, value ? value : "");
}

void ResultAnnotate(void* opaque, const char* text) {
    if (text) Out(opaque)->annotations.push_back(text);
}

bool ReadAll(const std::string& path, std::string* bytes, std::string* error) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        if (error) *error = "cannot read " + path;
        return false;
    }
    bytes->assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    if (in.bad()) {
        if (error) *error = "cannot read " + path;
        return false;
    }
    return true;
}

// Writes `bytes` to a fresh private file. Every open maps its own inode, so the loader
// never hands back an earlier build that was loaded from the same path.
bool StageCopy(const std::string& bytes, std::string* staged, std::string* error) {
    const char* dir = std::getenv("TMPDIR");
    std::string tmpl = std::string(dir && *dir ? dir : "/tmp") + "/addonhub-addon-XXXXXX";
    std::vector<char> name(tmpl.begin(), tmpl.end());
    name.push_back('\0');
    const int fd = ::mkstemp(name.data());
    if (fd < 0) {
        if (error) *error = "cannot stage addon copy in " + tmpl + ": " + std::strerror(errno);
        return false;
    }
    size_t off = 0;
    bool ok = ::fchmod(fd, 0700) == 0;
    while (ok && off < bytes.size()) {
        const ssize_t n = ::write(fd, bytes.data() + off, bytes.size() - off);
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) {
            ok = false;
            break;
        }
        off += static_cast<size_t>(n);
    }
    const int saved = errno;
    if (::close(fd) != 0) ok = false;
    if (!ok) {
        ::unlink(name.data());
        if (error) *error = std::string("cannot stage addon copy ") + name.data() + ": " + std::strerror(saved);
        return false;
    }
    *staged = name.data();
    return true;
}

std::string SettingsText(const AddonSettings& settings) {
    std::ostringstream oss;
    for (const auto& kv : settings) oss << kv.first << "=" << kv.second << "\n";
    return oss.str();
}

} // namespace

SharedLibraryAddon::~SharedLibraryAddon() {
    Shutdown();
    if (handle_) {
        ::dlclose(handle_);
        handle_ = nullptr;
    }
}

bool SharedLibraryAddon::Sha256File(const std::string& path, std::string* hex, std::string* error) {
    std::string bytes;
    if (!ReadAll(path, &bytes, error)) return false;
    return Sha256(bytes, hex, error);
}

bool SharedLibraryAddon::Sha256(const std::string& bytes, std::string* hex, std::string* error) {
    EVP_MD_CTX* md = EVP_MD_CTX_new();
    if (!md || EVP_DigestInit_ex(md, EVP_sha256(), nullptr) != 1 ||
        EVP_DigestUpdate(md, bytes.data(), bytes.size()) != 1) {
        EVP_MD_CTX_free(md);
        if (error) *error = "sha256 digest failed";
        return false;
    }
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int len = 0;
    const int rc = EVP_DigestFinal_ex(md, digest, &len);
    EVP_MD_CTX_free(md);
    if (rc != 1) {
        if (error) *error = "sha256 final failed";
        return false;
    }
    static const char kHex[] = "0123456789abcdef";
    hex->clear();
    hex->reserve(len * 2);
    for (unsigned int i = 0; i < len; ++i) {
        hex->push_back(kHex[digest[i] >> 4]);
        hex->push_back(kHex[digest[i] & 0x0f]);
    }
    return true;
}

std::unique_ptr<SharedLibraryAddon> SharedLibraryAddon::Open(const std::string& path, const std::string& pinnedSha256,
                                                             std::string* error) {
    std::unique_ptr<SharedLibraryAddon> addon(new SharedLibraryAddon());
    addon->path_ = path;

    // The digest and the mapping come from the same bytes.
    std::string bytes;
    if (!ReadAll(path, &bytes, error)) return nullptr;
    if (!Sha256(bytes, &addon->fingerprint_, error)) return nullptr;
    if (!pinnedSha256.empty() && Lower(pinnedSha256) != addon->fingerprint_) {
        if (error) *error = "sha256 mismatch for " + path + ": got " + addon->fingerprint_;
        return nullptr;
    }

    std::string staged;
    if (!StageCopy(bytes, &staged, error)) return nullptr;
    addon->handle_ = ::dlopen(staged.c_str(), RTLD_NOW | RTLD_LOCAL);
    const std::string dlerr = addon->handle_ ? std::string() : DlError();
    // The mapping keeps the inode alive.
    if (::unlink(staged.c_str()) != 0) {
        LOG_WARN << "Cannot remove staged addon copy " << staged << ": " << std::strerror(errno);
    }
    if (!addon->handle_) {
        if (error) *error = "dlopen failed for " + path + ": " + dlerr;
        return nullptr;
    }
    void* sym = ::dlsym(addon->handle_, ADDONHUB_ADDON_GET_SYMBOL);
    if (!sym) {
        if (error) *error = std::string("missing symbol ") + ADDONHUB_ADDON_GET_SYMBOL + " in " + path;
        return nullptr;
    }
    auto getApi = reinterpret_cast<addonhub_addon_get_v1_fn>(sym);
    const addonhub_addon_v1* api = getApi();
    if (!api || api->api_version != ADDONHUB_ADDON_API_VERSION || !api->name || !api->on_hook) {
        if (error) *error = "addon API mismatch in " + path;
        return nullptr;
    }
    addon->api_ = api;
    addon->name_ = api->name;
    addon->version_ = api->version ? api->version : "0";

    for (size_t i = 0; i < api->hook_count; ++i) {
        const addonhub_hook_decl_v1& d = api->hooks[i];
        HookDeclaration decl;
        decl.name = d.name ? d.name : "";
        if (!d.event || !ParseEventKind(d.event, &decl.kind)) {
            if (error) *error = "hook '" + decl.name + "' declares unknown event '" + (d.event ? d.event : "") + "'";
            return nullptr;
        }
        decl.rule = d.rule ? d.rule : "";
        decl.priority = d.priority;
        decl.shortCircuit = d.short_circuit != 0;
        decl.blocking = d.blocking != 0;
        addon->hooks_.push_back(std::move(decl));
    }

    addon->host_.api_version = ADDONHUB_ADDON_API_VERSION;
    addon->host_.host_ctx = addon.get();
    addon->host_.log = &SharedLibraryAddon::HostLog;
    LOG_INFO << "Addon library opened: " << addon->name_ << " " << addon->version_ << " from " << path
             << " sha256=" << addon->fingerprint_;
    return addon;
}

AddonFactory SharedLibraryAddon::Factory(const std::string& path, const std::string& pinnedSha256) {
    return [path, pinnedSha256](std::string* error) -> std::unique_ptr<AddonModule> {
        return Open(path, pinnedSha256, error);
    };
}

void SharedLibraryAddon::HostLog(void* hostCtx, int level, const char* msg) {
    if (!msg) return;
    const SharedLibraryAddon* self = static_cast<const SharedLibraryAddon*>(hostCtx);
    const std::string tag = "[addon:" + (self ? self->name_ : std::string("?")) + "] ";
    switch (level) {
        case ADDONHUB_LOG_DEBUG:
            LOG_DEBUG << tag << msg;
            break;
        case ADDONHUB_LOG_INFO:
            LOG_INFO << tag << msg;
            break;
        case ADDONHUB_LOG_WARN:
            LOG_WARN << tag << msg;
            break;
        case ADDONHUB_LOG_ERROR:
        default:
            LOG_ERROR << tag << msg;
            break;
    }
}

bool SharedLibraryAddon::Init(const AddonSettings& settings, std::string* error) {
    if (ctx_) return true;
    if (!api_->create) return true;
    char err[256] = {0};
    const std::string text = SettingsText(settings);
    ctx_ = api_->create(&host_, text.c_str(), err, sizeof(err));
    if (!ctx_) {
        if (error) *error = err[0] ? err : "create returned no context";
        return false;
    }
    return true;
}

void SharedLibraryAddon::Shutdown() {
    if (ctx_ && api_ && api_->destroy) api_->destroy(ctx_);
    ctx_ = nullptr;
}

bool SharedLibraryAddon::Handle(const std::string& hook, const TrafficEvent& event, Contribution* out,
                                std::string* error) {
    const EventAttributes& a = event.attributes();
    std::vector<addonhub_header_v1> headers;
    headers.reserve(a.headers.size());
    for (const auto& h : a.headers) headers.push_back({h.name.c_str(), h.value.c_str()});

    addonhub_event_v1 ev{};
    ev.kind = static_cast<int>(EventKindIndex(event.kind()));
    ev.flow_id = OrEmpty(event.flowId());
    ev.method = OrEmpty(a.method);
    ev.scheme = OrEmpty(a.scheme);
    ev.host = OrEmpty(a.host);
    ev.port = a.port;
    ev.path = OrEmpty(a.path);
    ev.query = OrEmpty(a.query);
    ev.content_type = OrEmpty(a.contentType);
    ev.headers = headers.data();
    ev.header_count = headers.size();
    ev.body = a.body.data();
    ev.body_len = a.body.size();
    ev.status_code = a.statusCode;
    ev.client_ip = OrEmpty(a.clientIp);
    ev.client_port = a.clientPort;
    ev.server_ip = OrEmpty(a.serverIp);
    ev.tls_sni = OrEmpty(a.tlsSni);
    ev.tls_version = OrEmpty(a.tlsVersion);
    ev.ws_message = a.wsMessage.data();
    ev.ws_message_len = a.wsMessage.size();
    ev.ws_from_client = a.wsFromClient ? 1 : 0;
    ev.error_message = OrEmpty(a.errorMessage);

    addonhub_result_v1 result{};
    result.opaque = out;
    result.set_header = &ResultSetHeader;
    result.remove_header = &ResultRemoveHeader;
    result.replace_body = &ResultReplaceBody;
    result.block = &ResultBlock;
    result.respond = &ResultRespond;
    result.respond_header = &ResultRespondHeader;
    result.annotate = &ResultAnnotate;

    char err[256] = {0};
    const int rc = api_->on_hook(ctx_, hook.c_str(), &ev, &result, err, sizeof(err));
    if (rc != 0) {
        if (error) *error = err[0] ? err : "on_hook returned " + std::to_string(rc);
        return false;
    }
    return true;
}

} // namespace core
} // namespace addonhub
