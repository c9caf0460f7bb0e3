#pragma once

#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include "addonhub/common/noncopyable.h"

namespace addonhub {
namespace common {

// INI settings store shared by the daemon and the addon loader.
// Keys outside any [section] land in "global".
class Config : noncopyable {
public:
    using Section = std::map<std::string, std::string>;

    static Config& Instance();

    bool Load(const std::string& filename);
    // Parse INI text into in-memory settings (does not change loaded filename).
    bool LoadFromString(const std::string& iniText);

    void SetString(const std::string& section, const std::string& key, const std::string& value);
    void Clear();

    std::optional<std::string> LoadedFilename() const;
    std::string DumpIni() const;

    std::string GetString(const std::string& section, const std::string& key, const std::string& defaultVal = "") const;
    int GetInt(const std::string& section, const std::string& key, int defaultVal = 0) const;
    double GetDouble(const std::string& section, const std::string& key, double defaultVal = 0.0) const;
    // Accepts 1/0, true/false, yes/no, on/off.
    bool GetBool(const std::string& section, const std::string& key, bool defaultVal = false) const;

    // Sections whose name starts with prefix, in name order.
    std::vector<std::pair<std::string, Section>> GetSectionsWithPrefix(const std::string& prefix) const;

    static std::string Trim(const std::string& s);
    static bool ParseBool(const std::string& s, bool* out);
    static bool ParseInt(const std::string& s, long* out);

private:
    Config() = default;
    static std::map<std::string, Section> Parse(std::istream& in);

    mutable std::mutex mutex_;
    std::map<std::string, Section> settings_;
    std::string loadedFilename_;
};

} // namespace common
} // namespace addonhub
