#include "addonhub/monitor/AuditLogger.h"
#include "addonhub/common/Logger.h"

#include <chrono>
#include <ctime>

namespace addonhub {
namespace monitor {

static std::string IsoNow() {
    const auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tmBuf{};
    ::gmtime_r(&now, &tmBuf);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tmBuf);
    return buf;
}

AuditLogger::AuditLogger(const std::string& path) : path_(path) {
    if (path_.empty()) return;
    fp_ = std::fopen(path_.c_str(), "a");
    if (!fp_) {
        LOG_ERROR << "AuditLogger fopen failed path=" << path_;
    }
}

AuditLogger::~AuditLogger() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (fp_) {
        std::fflush(fp_);
        std::fclose(fp_);
        fp_ = nullptr;
    }
}

void AuditLogger::RecordTransition(const std::string& addonId,
                                   const std::string& from,
                                   const std::string& to,
                                   const std::string& reason) {
    std::string line = IsoNow() + " " + addonId + " " + from + " -> " + to;
    if (!reason.empty()) line += " " + reason;
    AppendLine(line);
}

void AuditLogger::AppendLine(const std::string& line) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!fp_) return;
    std::fwrite(line.data(), 1, line.size(), fp_);
    std::fwrite("\n", 1, 1, fp_);
    std::fflush(fp_);
}

} // namespace monitor
} // namespace addonhub
