#pragma once

#include <cstdio>
#include <mutex>
#include <string>

namespace addonhub {
namespace monitor {

// Append-only record of addon lifecycle transitions, one line per transition:
//   <iso-time> <addon-id> <from> -> <to> [reason]
class AuditLogger {
public:
    explicit AuditLogger(const std::string& path);
    ~AuditLogger();

    bool ok() const { return fp_ != nullptr; }

    void RecordTransition(const std::string& addonId,
                          const std::string& from,
                          const std::string& to,
                          const std::string& reason);

    // Thread-safe append one line (already formatted).
    void AppendLine(const std::string& line);

    const std::string& path() const { return path_; }

private:
    std::string path_;
    std::mutex mutex_;
    std::FILE* fp_{nullptr};
};

} // namespace monitor
} // namespace addonhub
