#pragma once

#include <string>
#include <mutex>
#include <sstream>

namespace addonhub {
namespace common {

enum class LogLevel {
    DEBUG,
    INFO,
    WARN,
    ERROR,
    FATAL
};

// Process-wide logger for addonhub: lifecycle transitions, dispatch failures and timeouts,
// config errors, and lines addons send through the host log callback (tagged
// "[addon:<name>]"). Writes timestamped lines to stderr; the level comes from
// [global] log_level.
class Logger {
public:
    static Logger& Instance();

    void SetLevel(LogLevel level);
    LogLevel GetLevel() const { return level_; }
    LogLevel ParseLevel(const std::string& levelStr) const;

    // Colors are only emitted when stderr is a terminal unless forced here.
    void SetColor(bool enabled);

    void Log(LogLevel level, const char* file, int line, const std::string& msg);

private:
    Logger();
    ~Logger() = default;
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    LogLevel level_ = LogLevel::INFO;
    bool color_{false};
    std::mutex mutex_;
};

// Stream wrapper to allow usage like: LOG_INFO << "Message " << 123;
class LogStream {
public:
    LogStream(LogLevel level, const char* file, int line)
        : level_(level), file_(file), line_(line) {}

    ~LogStream() {
        Logger::Instance().Log(level_, file_, line_, ss_.str());
    }

    template <typename T>
    LogStream& operator<<(const T& val) {
        ss_ << val;
        return *this;
    }

private:
    LogLevel level_;
    const char* file_;
    int line_;
    std::stringstream ss_;
};

} // namespace common
} // namespace addonhub

#define LOG_DEBUG \
    if (addonhub::common::LogLevel::DEBUG >= addonhub::common::Logger::Instance().GetLevel()) \
    addonhub::common::LogStream(addonhub::common::LogLevel::DEBUG, __FILE__, __LINE__)

#define LOG_INFO \
    if (addonhub::common::LogLevel::INFO >= addonhub::common::Logger::Instance().GetLevel()) \
    addonhub::common::LogStream(addonhub::common::LogLevel::INFO, __FILE__, __LINE__)

#define LOG_WARN \
    if (addonhub::common::LogLevel::WARN >= addonhub::common::Logger::Instance().GetLevel()) \
    addonhub::common::LogStream(addonhub::common::LogLevel::WARN, __FILE__, __LINE__)

#define LOG_ERROR \
    if (addonhub::common::LogLevel::ERROR >= addonhub::common::Logger::Instance().GetLevel()) \
    addonhub::common::LogStream(addonhub::common::LogLevel::ERROR, __FILE__, __LINE__)

#define LOG_FATAL \
    if (addonhub::common::LogLevel::FATAL >= addonhub::common::Logger::Instance().GetLevel()) \
    addonhub::common::LogStream(addonhub::common::LogLevel::FATAL, __FILE__, __LINE__)
