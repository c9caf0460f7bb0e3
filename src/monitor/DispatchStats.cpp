#include "addonhub/monitor/DispatchStats.h"

#include <cstdio>
#include <iomanip>
#include <sstream>

namespace addonhub {
namespace monitor {

DispatchStats::DispatchStats() : startTime_(std::chrono::steady_clock::now()) {}

void DispatchStats::RecordHookLatencyUs(long long us) {
    hookLatencyUsTotal_.fetch_add(us, std::memory_order_relaxed);
    long long prev = hookLatencyUsMax_.load(std::memory_order_relaxed);
    while (us > prev && !hookLatencyUsMax_.compare_exchange_weak(prev, us, std::memory_order_relaxed)) {
    }
}

std::string DispatchStats::ToJson() const {
    const auto uptime =
        std::chrono::duration_cast<std::chrono::seconds>(std::chrono::steady_clock::now() - startTime_).count();
    const long long inv = invocations();
    const double avgUs = inv > 0 ? static_cast<double>(hookLatencyUsTotal_.load()) / static_cast<double>(inv) : 0.0;

    std::stringstream ss;
    ss << "{\n";
    ss << "  \"uptime_sec\": " << uptime << ",\n";
    ss << "  \"events\": " << events() << ",\n";
    ss << "  \"pass_through\": " << passThrough() << ",\n";
    ss << "  \"terminal_verdicts\": " << terminal() << ",\n";
    ss << "  \"hook_invocations\": " << inv << ",\n";
    ss << "  \"hook_failures\": " << failures() << ",\n";
    ss << "  \"hook_timeouts\": " << timeouts() << ",\n";
    ss << "  \"hook_expired\": " << expired() << ",\n";
    ss << "  \"short_circuits\": " << shortCircuits() << ",\n";
    ss << "  \"budget_skips\": " << budgetSkips() << ",\n";
    ss << "  \"quarantine_requests\": " << quarantineRequests() << ",\n";
    ss << "  \"hook_latency_us\": {\n";
    ss << "    \"avg\": " << std::fixed << std::setprecision(2) << avgUs << ",\n";
    ss << "    \"max\": " << hookLatencyUsMax_.load() << "\n";
    ss << "  }\n";
    ss << "}";
    return ss.str();
}

std::string JsonEscape(const std::string& s) {
    std::string out;
    out.reserve(s.size() + 8);
    for (unsigned char c : s) {
        switch (c) {
            case '"': out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            default:
                if (c < 0x20) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x", c);
                    out += buf;
                } else {
                    out.push_back(static_cast<char>(c));
                }
        }
    }
    return out;
}

} // namespace monitor
} // namespace addonhub
