#pragma once

#include "addonhub/common/Config.h"
#include "addonhub/common/Error.h"
#include "addonhub/core/Addon.h"

#include <map>
#include <string>
#include <vector>

namespace addonhub {
namespace core {

class LifecycleManager;

// One [addon.<id>] section.
struct AddonSpec {
    std::string id;
    std::string path;     // shared library
    std::string builtin;  // or a registered built-in
    std::string sha256;
    bool enable{true};
    AddonConfig config;
};

// Installs addons described in configuration.
class AddonLoader {
public:
    explicit AddonLoader(LifecycleManager* manager);

    void RegisterBuiltin(const std::string& name, AddonFactory factory);

    // Errors name the offending key, e.g. "hook.inject.priority".
    static bool ParseSection(const std::string& id, const common::Config::Section& section, AddonSpec* out,
                             common::Error* err);

    bool Install(const AddonSpec& spec, common::Error* err);

    // Installs every [addon.*] section; one bad section does not stop the others.
    // Returns the number installed.
    size_t InstallFromConfig(const common::Config& conf, std::vector<common::Error>* errors);
    // Parses every [addon.*] section without installing anything.
    static bool CheckConfig(const common::Config& conf, std::vector<common::Error>* errors);

private:
    bool FactoryFor(const AddonSpec& spec, AddonFactory* out, common::Error* err) const;

    LifecycleManager* manager_;
    std::map<std::string, AddonFactory> builtins_;
};

} // namespace core
} // namespace addonhub
