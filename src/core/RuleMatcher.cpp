#include "addonhub/core/RuleMatcher.h"
#include "addonhub/common/Logger.h"

#include <atomic>
#include <cctype>

namespace addonhub {
namespace core {

using common::Error;
using common::ErrorCode;
using common::Fail;

static std::atomic<size_t> gRegexSubjectLimit{RuleMatcher::kDefaultRegexSubjectLimit};
static std::atomic<bool> gRegexLimitWarned{false};

static bool RegexMatch(const Predicate& p, const std::string& s) {
    if (!p.regex) return false;
    if (s.size() > gRegexSubjectLimit.load(std::memory_order_relaxed)) {
        if (!gRegexLimitWarned.exchange(true)) {
            LOG_WARN << "Regex predicate '" << p.ToString() << "' skipped a " << s.size()
                     << "-byte subject (limit " << gRegexSubjectLimit.load() << "); further skips are silent";
        }
        return false;
    }
    return std::regex_search(s, *p.regex, std::regex_constants::match_continuous);
}

static inline char Lower(char c) {
    return static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
}

static bool StartsWith(const std::string& s, const std::string& prefix, bool ignoreCase) {
    if (prefix.size() > s.size()) return false;
    for (size_t i = 0; i < prefix.size(); ++i) {
        if (ignoreCase ? Lower(s[i]) != Lower(prefix[i]) : s[i] != prefix[i]) return false;
    }
    return true;
}

static bool EndsWith(const std::string& s, const std::string& suffix, bool ignoreCase) {
    if (suffix.size() > s.size()) return false;
    const size_t off = s.size() - suffix.size();
    for (size_t i = 0; i < suffix.size(); ++i) {
        if (ignoreCase ? Lower(s[off + i]) != Lower(suffix[i]) : s[off + i] != suffix[i]) return false;
    }
    return true;
}

static bool Contains(const std::string& s, const std::string& needle, bool ignoreCase) {
    if (needle.empty()) return true;
    if (needle.size() > s.size()) return false;
    for (size_t i = 0; i + needle.size() <= s.size(); ++i) {
        size_t j = 0;
        for (; j < needle.size(); ++j) {
            if (ignoreCase ? Lower(s[i + j]) != Lower(needle[j]) : s[i + j] != needle[j]) break;
        }
        if (j == needle.size()) return true;
    }
    return false;
}

static bool Equals(const std::string& a, const std::string& b, bool ignoreCase) {
    return ignoreCase ? IEquals(a, b) : a == b;
}

static bool InRanges(long v, const std::vector<std::pair<long, long>>& ranges) {
    for (const auto& r : ranges) {
        if (v >= r.first && v <= r.second) return true;
    }
    return false;
}

bool RuleMatcher::GlobMatch(const std::string& pattern, const std::string& text, bool ignoreCase) {
    size_t p = 0, t = 0;
    size_t starP = std::string::npos, starT = 0;
    while (t < text.size()) {
        if (p < pattern.size() && pattern[p] == '*') {
            starP = p++;
            starT = t;
        } else if (p < pattern.size() &&
                   (ignoreCase ? Lower(pattern[p]) == Lower(text[t]) : pattern[p] == text[t])) {
            ++p;
            ++t;
        } else if (starP != std::string::npos) {
            p = starP + 1;
            t = ++starT;
        } else {
            return false;
        }
    }
    while (p < pattern.size() && pattern[p] == '*') ++p;
    return p == pattern.size();
}

bool RuleMatcher::MatchDomainWildcard(const std::string& pattern, const std::string& host) {
    if (pattern.rfind("*.", 0) == 0) {
        const std::string domain = pattern.substr(1);  // ".a.com"
        if (!EndsWith(host, domain, true)) return false;
        const size_t labelLen = host.size() - domain.size();
        if (labelLen == 0) return false;
        return host.find('.') >= labelLen;
    }
    if (pattern.rfind("+.", 0) == 0) {
        const std::string domain = pattern.substr(2);
        return IEquals(host, domain) || EndsWith(host, "." + domain, true);
    }
    if (!pattern.empty() && pattern[0] == '.') {
        return host.size() > pattern.size() && EndsWith(host, pattern, true);
    }
    return GlobMatch(pattern, host, true);
}

bool RuleMatcher::EvalPredicate(const Predicate& p, const EventAttributes& a) {
    const std::string* subject = nullptr;
    bool ignoreCase = false;
    switch (p.field) {
        case RuleField::kHost:
            subject = &a.host;
            ignoreCase = true;
            break;
        case RuleField::kPath:
            subject = &a.path;
            break;
        case RuleField::kMethod:
            subject = &a.method;
            ignoreCase = true;
            break;
        case RuleField::kScheme:
            subject = &a.scheme;
            ignoreCase = true;
            break;
        case RuleField::kContentType:
            subject = &a.contentType;
            ignoreCase = true;
            break;
        case RuleField::kClientIp:
            subject = &a.clientIp;
            break;
        case RuleField::kServerIp:
            subject = &a.serverIp;
            break;
        case RuleField::kHeader:
            subject = FindHeader(a.headers, p.headerName);
            if (p.op == RuleOp::kExists) return subject != nullptr;
            if (!subject) return false;
            break;
        case RuleField::kPort:
            return InRanges(a.port, p.ranges);
        case RuleField::kClientPort:
            return InRanges(a.clientPort, p.ranges);
    }
    if (!subject) return false;

    const std::string& s = *subject;
    switch (p.op) {
        case RuleOp::kEquals:
            return Equals(s, p.value, ignoreCase);
        case RuleOp::kPrefix:
            return StartsWith(s, p.value, ignoreCase);
        case RuleOp::kSuffix:
            return EndsWith(s, p.value, ignoreCase);
        case RuleOp::kContains:
            return Contains(s, p.value, ignoreCase);
        case RuleOp::kRegex:
            return RegexMatch(p, s);
        case RuleOp::kWildcard:
            if (p.field == RuleField::kHost) return MatchDomainWildcard(p.value, s);
            return GlobMatch(p.value, s, ignoreCase);
        case RuleOp::kCidr: {
            std::uint32_t ip = 0;
            if (!RuleParser::ParseIpv4(s, &ip)) return false;
            return (ip & p.mask) == p.network;
        }
        case RuleOp::kRange:
        case RuleOp::kExists:
            return false;
    }
    return false;
}

void RuleMatcher::SetRegexSubjectLimit(size_t limit) {
    gRegexSubjectLimit.store(limit, std::memory_order_relaxed);
}

size_t RuleMatcher::RegexSubjectLimit() {
    return gRegexSubjectLimit.load(std::memory_order_relaxed);
}

bool RuleMatcher::Matches(const HookRule& rule, EventKind kind, const EventAttributes& attrs) {
    if (rule.kind != kind) return false;
    for (const auto& p : rule.predicates) {
        if (!EvalPredicate(p, attrs)) return false;
    }
    return true;
}

bool RuleMatcher::Matches(const HookRule& rule, const TrafficEvent& event) {
    return Matches(rule, event.kind(), event.attributes());
}

bool RuleMatcher::Validate(const HookRule& rule, Error* err, const std::string& field) {
    if (EventKindIndex(rule.kind) >= kEventKindCount) {
        return Fail(err, ErrorCode::kInvalidRule, "unknown event kind", field);
    }
    for (const auto& p : rule.predicates) {
        if (static_cast<int>(p.op) < static_cast<int>(RuleOp::kEquals) ||
            static_cast<int>(p.op) > static_cast<int>(RuleOp::kExists)) {
            return Fail(err, ErrorCode::kInvalidRule, "unknown operator", field);
        }
        if (static_cast<int>(p.field) < static_cast<int>(RuleField::kHost) ||
            static_cast<int>(p.field) > static_cast<int>(RuleField::kHeader)) {
            return Fail(err, ErrorCode::kInvalidRule, "unknown field", field);
        }
        // Re-derive the predicate from its textual parts; this catches hand-built predicates
        // whose precomputed data is missing or inconsistent.
        Predicate rebuilt;
        if (!RuleParser::MakePredicate(p.field, p.headerName, p.op, p.value, &rebuilt, err, field)) return false;
        if (p.op == RuleOp::kRegex && !p.regex) {
            return Fail(err, ErrorCode::kInvalidRule, "pattern not compiled: " + p.ToString(), field);
        }
        if ((p.field == RuleField::kPort || p.field == RuleField::kClientPort) && p.ranges.empty()) {
            return Fail(err, ErrorCode::kInvalidRule, "port predicate without ranges: " + p.ToString(), field);
        }
    }
    return true;
}

} // namespace core
} // namespace addonhub
