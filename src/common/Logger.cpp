#include "addonhub/common/Logger.h"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <unistd.h>

namespace addonhub {
namespace common {

static std::string CurrentTimestamp() {
    auto now = std::chrono::system_clock::now();
    auto inTime = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;

    std::tm tmBuf{};
    ::localtime_r(&inTime, &tmBuf);
    std::stringstream ss;
    ss << std::put_time(&tmBuf, "%Y-%m-%d %H:%M:%S");
    ss << '.' << std::setfill('0') << std::setw(3) << ms.count();
    return ss.str();
}

static const char* LevelToString(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO:  return "INFO ";
        case LogLevel::WARN:  return "WARN ";
        case LogLevel::ERROR: return "ERROR";
        case LogLevel::FATAL: return "FATAL";
        default: return "UNKNOWN";
    }
}

static const char* LevelToColor(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "\033[36m"; // Cyan
        case LogLevel::INFO:  return "\033[32m"; // Green
        case LogLevel::WARN:  return "\033[33m"; // Yellow
        case LogLevel::ERROR: return "\033[31m"; // Red
        case LogLevel::FATAL: return "\033[35m"; // Magenta
        default: return "\033[0m";
    }
}

// Strip the directory part so log lines stay short.
static const char* BaseName(const char* file) {
    if (!file) return "";
    const char* base = file;
    for (const char* p = file; *p; ++p) {
        if (*p == '/') base = p + 1;
    }
    return base;
}

Logger::Logger() : color_(::isatty(STDERR_FILENO) == 1) {}

Logger& Logger::Instance() {
    static Logger instance;
    return instance;
}

void Logger::SetLevel(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    level_ = level;
}

void Logger::SetColor(bool enabled) {
    std::lock_guard<std::mutex> lock(mutex_);
    color_ = enabled;
}

LogLevel Logger::ParseLevel(const std::string& levelStr) const {
    if (levelStr == "DEBUG") return LogLevel::DEBUG;
    if (levelStr == "INFO") return LogLevel::INFO;
    if (levelStr == "WARN") return LogLevel::WARN;
    if (levelStr == "ERROR") return LogLevel::ERROR;
    if (levelStr == "FATAL") return LogLevel::FATAL;
    return LogLevel::INFO;
}

void Logger::Log(LogLevel level, const char* file, int line, const std::string& msg) {
    std::lock_guard<std::mutex> lock(mutex_);

    // Format: [Time] [Level] [File:Line] Message
    if (color_) std::cerr << LevelToColor(level);
    std::cerr << "[" << CurrentTimestamp() << "] "
              << "[" << LevelToString(level) << "] "
              << "[" << BaseName(file) << ":" << line << "] "
              << msg;
    if (color_) std::cerr << "\033[0m";
    std::cerr << std::endl;
}

} // namespace common
} // namespace addonhub
