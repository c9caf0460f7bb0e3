#pragma once

#include "addonhub/common/AddonApi.h"
#include "addonhub/core/Addon.h"

#include <memory>
#include <string>
#include <vector>

namespace addonhub {
namespace core {

// AddonModule backed by a shared library exporting `addonhub_addon_get_v1`.
// The library stays mapped while the module lives; each module owns its own mapping and
// one addon context.
class SharedLibraryAddon : public AddonModule {
public:
    ~SharedLibraryAddon() override;

    // Reads `path` once, computes the SHA-256 of those bytes and maps a private copy of them,
    // then checks the ABI version. When `pinnedSha256` is non-empty the digest must match it.
    // Reopening a path whose file was replaced loads the new contents.
    static std::unique_ptr<SharedLibraryAddon> Open(const std::string& path, const std::string& pinnedSha256,
                                                    std::string* error);
    // Factory that opens the library anew on every install or upgrade.
    static AddonFactory Factory(const std::string& path, const std::string& pinnedSha256 = "");

    // Lowercase hex SHA-256 of a file's contents.
    static bool Sha256File(const std::string& path, std::string* hex, std::string* error);
    static bool Sha256(const std::string& bytes, std::string* hex, std::string* error);

    std::string Name() const override { return name_; }
    std::string Version() const override { return version_; }
    std::vector<HookDeclaration> Hooks() const override { return hooks_; }
    bool Init(const AddonSettings& settings, std::string* error) override;
    void Shutdown() override;
    bool Handle(const std::string& hook, const TrafficEvent& event, Contribution* out, std::string* error) override;
    std::string Fingerprint() const override { return fingerprint_; }

    const std::string& path() const { return path_; }

private:
    SharedLibraryAddon() = default;

    static void HostLog(void* hostCtx, int level, const char* msg);

    std::string path_;
    void* handle_{nullptr};
    const addonhub_addon_v1* api_{nullptr};
    addonhub_host_v1 host_{};
    void* ctx_{nullptr};
    std::string name_;
    std::string version_;
    std::string fingerprint_;
    std::vector<HookDeclaration> hooks_;
};

} // namespace core
} // namespace addonhub
