#include "addonhub/common/Config.h"
#include "addonhub/common/Logger.h"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace addonhub {
namespace common {

Config& Config::Instance() {
    static Config instance;
    return instance;
}

std::string Config::Trim(const std::string& s) {
    auto notSpace = [](unsigned char c) { return !std::isspace(c); };
    auto start = std::find_if(s.begin(), s.end(), notSpace);
    auto end = std::find_if(s.rbegin(), s.rend(), notSpace).base();
    return (start < end) ? std::string(start, end) : std::string();
}

bool Config::ParseBool(const std::string& s, bool* out) {
    if (!out) return false;
    std::string v = Trim(s);
    std::transform(v.begin(), v.end(), v.begin(), [](unsigned char c) { return std::tolower(c); });
    if (v == "1" || v == "true" || v == "yes" || v == "on") {
        *out = true;
        return true;
    }
    if (v == "0" || v == "false" || v == "no" || v == "off") {
        *out = false;
        return true;
    }
    return false;
}

bool Config::ParseInt(const std::string& s, long* out) {
    if (!out) return false;
    const std::string v = Trim(s);
    if (v.empty()) return false;
    errno = 0;
    char* end = nullptr;
    const long n = std::strtol(v.c_str(), &end, 10);
    if (errno != 0 || end == v.c_str() || *end != '\0') return false;
    *out = n;
    return true;
}

std::map<std::string, Config::Section> Config::Parse(std::istream& in) {
    std::map<std::string, Section> parsed;
    std::string line, section = "global";
    while (std::getline(in, line)) {
        line = Trim(line);
        if (line.empty() || line[0] == '#' || line[0] == ';') continue;

        if (line[0] == '[' && line.back() == ']') {
            section = Trim(line.substr(1, line.size() - 2));
            continue;
        }

        auto delimiterPos = line.find('=');
        if (delimiterPos != std::string::npos) {
            std::string key = Trim(line.substr(0, delimiterPos));
            std::string value = Trim(line.substr(delimiterPos + 1));
            if (!key.empty()) parsed[section][key] = value;
        }
    }
    return parsed;
}

bool Config::Load(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        LOG_ERROR << "Failed to open config file: " << filename;
        return false;
    }
    auto parsed = Parse(file);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        settings_ = std::move(parsed);
        loadedFilename_ = filename;
    }
    LOG_INFO << "Loaded config file: " << filename;
    return true;
}

bool Config::LoadFromString(const std::string& iniText) {
    std::istringstream in(iniText);
    if (!in.good()) return false;
    auto parsed = Parse(in);
    std::lock_guard<std::mutex> lock(mutex_);
    settings_ = std::move(parsed);
    return true;
}

void Config::SetString(const std::string& section, const std::string& key, const std::string& value) {
    if (section.empty() || key.empty()) return;
    std::lock_guard<std::mutex> lock(mutex_);
    settings_[section][key] = value;
}

void Config::Clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    settings_.clear();
    loadedFilename_.clear();
}

std::optional<std::string> Config::LoadedFilename() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (loadedFilename_.empty()) return std::nullopt;
    return loadedFilename_;
}

std::string Config::DumpIni() const {
    std::map<std::string, Section> snap;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        snap = settings_;
    }

    std::ostringstream f;
    auto writeSection = [&](const std::string& section, const Section& kv) {
        f << "[" << section << "]\n";
        for (const auto& it : kv) {
            f << it.first << " = " << it.second << "\n";
        }
        f << "\n";
    };

    auto itg = snap.find("global");
    if (itg != snap.end()) {
        writeSection("global", itg->second);
        snap.erase(itg);
    }
    for (const auto& s : snap) {
        writeSection(s.first, s.second);
    }
    return f.str();
}

std::string Config::GetString(const std::string& section, const std::string& key, const std::string& defaultVal) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto sit = settings_.find(section);
    if (sit == settings_.end()) return defaultVal;
    auto kit = sit->second.find(key);
    if (kit == sit->second.end()) return defaultVal;
    return kit->second;
}

int Config::GetInt(const std::string& section, const std::string& key, int defaultVal) const {
    long n = 0;
    if (!ParseInt(GetString(section, key, ""), &n)) return defaultVal;
    return static_cast<int>(n);
}

double Config::GetDouble(const std::string& section, const std::string& key, double defaultVal) const {
    const std::string val = Trim(GetString(section, key, ""));
    if (val.empty()) return defaultVal;
    errno = 0;
    char* end = nullptr;
    const double d = std::strtod(val.c_str(), &end);
    if (errno != 0 || end == val.c_str() || *end != '\0') return defaultVal;
    return d;
}

bool Config::GetBool(const std::string& section, const std::string& key, bool defaultVal) const {
    bool b = defaultVal;
    if (!ParseBool(GetString(section, key, ""), &b)) return defaultVal;
    return b;
}

std::vector<std::pair<std::string, Config::Section>> Config::GetSectionsWithPrefix(const std::string& prefix) const {
    std::vector<std::pair<std::string, Section>> out;
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& kv : settings_) {
        if (kv.first.rfind(prefix, 0) != 0) continue;
        out.push_back({kv.first, kv.second});
    }
    return out;
}

} // namespace common
} // namespace addonhub
