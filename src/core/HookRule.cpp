#include "addonhub/core/HookRule.h"
#include "addonhub/common/Config.h"

#include <algorithm>
#include <arpa/inet.h>
#include <cctype>
#include <cstring>

namespace addonhub {
namespace core {

using common::Config;
using common::Error;
using common::ErrorCode;
using common::Fail;

static std::string ToLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return std::tolower(c); });
    return s;
}

static std::string ToUpper(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return std::toupper(c); });
    return s;
}

static bool IsCaseInsensitiveField(RuleField f) {
    return f == RuleField::kHost || f == RuleField::kMethod || f == RuleField::kScheme ||
           f == RuleField::kContentType;
}

static std::vector<std::string> SplitOn(const std::string& s, const std::string& sep) {
    std::vector<std::string> out;
    size_t start = 0;
    while (true) {
        const size_t pos = s.find(sep, start);
        if (pos == std::string::npos) {
            out.push_back(s.substr(start));
            break;
        }
        out.push_back(s.substr(start, pos - start));
        start = pos + sep.size();
    }
    return out;
}

const char* RuleFieldName(RuleField field) {
    switch (field) {
        case RuleField::kHost: return "host";
        case RuleField::kPath: return "path";
        case RuleField::kMethod: return "method";
        case RuleField::kScheme: return "scheme";
        case RuleField::kPort: return "port";
        case RuleField::kClientIp: return "client_ip";
        case RuleField::kClientPort: return "client_port";
        case RuleField::kServerIp: return "server_ip";
        case RuleField::kContentType: return "content_type";
        case RuleField::kHeader: return "header";
    }
    return "unknown";
}

const char* RuleOpName(RuleOp op) {
    switch (op) {
        case RuleOp::kEquals: return "equals";
        case RuleOp::kPrefix: return "prefix";
        case RuleOp::kSuffix: return "suffix";
        case RuleOp::kContains: return "contains";
        case RuleOp::kRegex: return "regex";
        case RuleOp::kWildcard: return "wildcard";
        case RuleOp::kRange: return "range";
        case RuleOp::kCidr: return "cidr";
        case RuleOp::kExists: return "exists";
    }
    return "unknown";
}

std::string Predicate::ToString() const {
    std::string out = RuleFieldName(field);
    if (field == RuleField::kHeader) out += "." + headerName;
    out += " ";
    out += RuleOpName(op);
    if (op != RuleOp::kExists) out += " " + value;
    return out;
}

bool RuleParser::ParseField(const std::string& token, RuleField* out, std::string* headerName) {
    if (!out) return false;
    const std::string t = ToLower(token);
    if (t.rfind("header.", 0) == 0 || t.rfind("header:", 0) == 0) {
        const std::string name = Config::Trim(token.substr(7));
        if (name.empty()) return false;
        if (headerName) *headerName = name;
        *out = RuleField::kHeader;
        return true;
    }
    if (t == "host" || t == "domain") *out = RuleField::kHost;
    else if (t == "path") *out = RuleField::kPath;
    else if (t == "method") *out = RuleField::kMethod;
    else if (t == "scheme") *out = RuleField::kScheme;
    else if (t == "port" || t == "dst_port") *out = RuleField::kPort;
    else if (t == "client_ip" || t == "src_ip") *out = RuleField::kClientIp;
    else if (t == "client_port" || t == "src_port") *out = RuleField::kClientPort;
    else if (t == "server_ip" || t == "dst_ip") *out = RuleField::kServerIp;
    else if (t == "content_type" || t == "content-type") *out = RuleField::kContentType;
    else return false;
    return true;
}

bool RuleParser::ParseOp(const std::string& token, RuleOp* out) {
    if (!out) return false;
    const std::string t = ToLower(token);
    if (t == "==" || t == "=" || t == "equals" || t == "eq") *out = RuleOp::kEquals;
    else if (t == "prefix" || t == "starts_with") *out = RuleOp::kPrefix;
    else if (t == "suffix" || t == "ends_with") *out = RuleOp::kSuffix;
    else if (t == "contains" || t == "keyword") *out = RuleOp::kContains;
    else if (t == "~" || t == "regex" || t == "matches") *out = RuleOp::kRegex;
    else if (t == "wildcard" || t == "glob") *out = RuleOp::kWildcard;
    else if (t == "range" || t == "in") *out = RuleOp::kRange;
    else if (t == "cidr") *out = RuleOp::kCidr;
    else if (t == "exists") *out = RuleOp::kExists;
    else return false;
    return true;
}

bool RuleParser::ParsePortRanges(const std::string& value, std::vector<std::pair<long, long>>* out) {
    if (!out) return false;
    out->clear();
    std::string normalized = value;
    std::replace(normalized.begin(), normalized.end(), '/', ',');
    for (const auto& raw : SplitOn(normalized, ",")) {
        const std::string part = Config::Trim(raw);
        if (part.empty()) return false;
        long lo = 0, hi = 0;
        const auto dash = part.find('-');
        if (dash == std::string::npos) {
            if (!Config::ParseInt(part, &lo)) return false;
            hi = lo;
        } else {
            if (!Config::ParseInt(part.substr(0, dash), &lo)) return false;
            if (!Config::ParseInt(part.substr(dash + 1), &hi)) return false;
        }
        if (lo < 0 || hi > 65535 || lo > hi) return false;
        out->push_back({lo, hi});
    }
    return !out->empty();
}

bool RuleParser::ParseIpv4(const std::string& ip, std::uint32_t* out) {
    if (!out) return false;
    in_addr addr;
    std::memset(&addr, 0, sizeof(addr));
    if (::inet_pton(AF_INET, ip.c_str(), &addr) != 1) return false;
    *out = ntohl(addr.s_addr);
    return true;
}

bool RuleParser::ParseCidr(const std::string& cidr, std::uint32_t* network, std::uint32_t* mask) {
    if (!network || !mask) return false;
    const std::string s = Config::Trim(cidr);
    if (s.empty()) return false;

    const auto slash = s.find('/');
    const std::string ipPart = Config::Trim(slash == std::string::npos ? s : s.substr(0, slash));
    const std::string prefixPart = Config::Trim(slash == std::string::npos ? "32" : s.substr(slash + 1));

    long prefix = -1;
    if (!Config::ParseInt(prefixPart, &prefix)) return false;
    if (prefix < 0 || prefix > 32) return false;

    std::uint32_t ip = 0;
    if (!ParseIpv4(ipPart, &ip)) return false;

    const std::uint32_t m = (prefix == 0) ? 0u : (0xFFFFFFFFu << (32 - prefix));
    *mask = m;
    *network = ip & m;
    return true;
}

bool RuleParser::MakePredicate(RuleField ruleField,
                               const std::string& headerName,
                               RuleOp op,
                               const std::string& value,
                               Predicate* out,
                               Error* err,
                               const std::string& field) {
    if (!out) return Fail(err, ErrorCode::kInvalidArgument, "null predicate", field);

    Predicate p;
    p.field = ruleField;
    p.headerName = headerName;
    p.op = op;
    p.value = IsCaseInsensitiveField(ruleField) ? ToLower(value) : value;

    const bool portField = ruleField == RuleField::kPort || ruleField == RuleField::kClientPort;
    const bool ipField = ruleField == RuleField::kClientIp || ruleField == RuleField::kServerIp;

    if (op == RuleOp::kExists && ruleField != RuleField::kHeader) {
        return Fail(err, ErrorCode::kInvalidRule,
                    std::string("'exists' only applies to headers, not ") + RuleFieldName(ruleField), field);
    }
    if (ruleField == RuleField::kHeader && headerName.empty()) {
        return Fail(err, ErrorCode::kInvalidRule, "header predicate without header name", field);
    }
    if (portField && op != RuleOp::kEquals && op != RuleOp::kRange) {
        return Fail(err, ErrorCode::kInvalidRule,
                    std::string("operator '") + RuleOpName(op) + "' not valid for " + RuleFieldName(ruleField), field);
    }
    if (op == RuleOp::kRange && !portField) {
        return Fail(err, ErrorCode::kInvalidRule,
                    std::string("'range' only applies to port fields, not ") + RuleFieldName(ruleField), field);
    }
    if (op == RuleOp::kCidr && !ipField) {
        return Fail(err, ErrorCode::kInvalidRule,
                    std::string("'cidr' only applies to ip fields, not ") + RuleFieldName(ruleField), field);
    }
    if (op != RuleOp::kExists && value.empty() && op != RuleOp::kEquals) {
        return Fail(err, ErrorCode::kInvalidRule,
                    std::string("missing value for '") + RuleOpName(op) + "'", field);
    }

    if (portField) {
        if (!ParsePortRanges(value, &p.ranges)) {
            return Fail(err, ErrorCode::kInvalidRule, "bad port specification '" + value + "'", field);
        }
    } else if (op == RuleOp::kCidr) {
        if (!ParseCidr(value, &p.network, &p.mask)) {
            return Fail(err, ErrorCode::kInvalidRule, "bad IPv4 CIDR '" + value + "'", field);
        }
    } else if (op == RuleOp::kRegex) {
        auto flags = std::regex::ECMAScript | std::regex::optimize;
        if (IsCaseInsensitiveField(ruleField)) flags |= std::regex::icase;
        try {
            p.regex = std::make_shared<const std::regex>(value, flags);
        } catch (const std::regex_error& e) {
            return Fail(err, ErrorCode::kInvalidRule, "bad pattern '" + value + "': " + e.what(), field);
        }
    }

    *out = std::move(p);
    return true;
}

bool RuleParser::ParseClause(const std::string& clause, Predicate* out, Error* err, const std::string& field) {
    const std::string c = Config::Trim(clause);
    if (c.empty()) return Fail(err, ErrorCode::kInvalidRule, "empty clause", field);

    size_t pos = c.find_first_of(" \t");
    const std::string fieldTok = c.substr(0, pos);
    std::string rest = (pos == std::string::npos) ? std::string() : Config::Trim(c.substr(pos));

    RuleField ruleField;
    std::string headerName;
    if (!ParseField(fieldTok, &ruleField, &headerName)) {
        return Fail(err, ErrorCode::kInvalidRule, "unknown field '" + fieldTok + "'", field);
    }
    if (rest.empty()) {
        return Fail(err, ErrorCode::kInvalidRule, "missing operator after '" + fieldTok + "'", field);
    }

    pos = rest.find_first_of(" \t");
    const std::string opTok = rest.substr(0, pos);
    std::string value = (pos == std::string::npos) ? std::string() : Config::Trim(rest.substr(pos));

    RuleOp op;
    if (!ParseOp(opTok, &op)) {
        return Fail(err, ErrorCode::kInvalidRule, "unknown operator '" + opTok + "'", field);
    }

    bool quoted = false;
    if (value.size() >= 2 && (value.front() == '"' || value.front() == '\'') && value.back() == value.front()) {
        value = value.substr(1, value.size() - 2);
        quoted = true;
    }
    if (op == RuleOp::kExists && !value.empty()) {
        return Fail(err, ErrorCode::kInvalidRule, "'exists' takes no value", field);
    }
    if (op != RuleOp::kExists && value.empty() && !quoted) {
        return Fail(err, ErrorCode::kInvalidRule, "missing value in '" + c + "'", field);
    }
    return MakePredicate(ruleField, headerName, op, value, out, err, field);
}

bool RuleParser::LooksLikeClash(const std::string& expr) {
    if (expr == "MATCH") return true;
    const auto comma = expr.find(',');
    if (comma == std::string::npos || comma == 0) return false;
    for (size_t i = 0; i < comma; ++i) {
        const char ch = expr[i];
        if (!(std::isupper(static_cast<unsigned char>(ch)) || ch == '-' || ch == '6')) return false;
    }
    return true;
}

bool RuleParser::ParseClashLine(const std::string& line, std::vector<Predicate>* out, Error* err, const std::string& field) {
    const std::string s = Config::Trim(line);
    const auto comma = s.find(',');
    const std::string type = ToUpper(Config::Trim(s.substr(0, comma)));
    const std::string rest = (comma == std::string::npos) ? std::string() : s.substr(comma + 1);

    if (type == "MATCH") return true;

    if (type == "AND") {
        const auto open = rest.find('(');
        if (open == std::string::npos) return Fail(err, ErrorCode::kInvalidRule, "AND without conditions", field);
        // Walk the outer group and collect each balanced "(...)" condition inside it.
        int depth = 0;
        size_t condStart = std::string::npos;
        bool closed = false;
        for (size_t i = open; i < rest.size(); ++i) {
            const char ch = rest[i];
            if (ch == '(') {
                ++depth;
                if (depth == 2) condStart = i + 1;
            } else if (ch == ')') {
                if (depth == 2 && condStart != std::string::npos) {
                    if (!ParseClashLine(rest.substr(condStart, i - condStart), out, err, field)) return false;
                    condStart = std::string::npos;
                }
                --depth;
                if (depth == 0) {
                    closed = true;
                    break;
                }
                if (depth < 0) break;
            }
        }
        if (!closed) return Fail(err, ErrorCode::kInvalidRule, "unbalanced parentheses in AND rule", field);
        return true;
    }
    if (type == "OR" || type == "NOT" || type == "SUB-RULE") {
        return Fail(err, ErrorCode::kInvalidRule, "only conjunctions (AND) are supported, got " + type, field);
    }

    const auto payloadEnd = rest.find(',');
    const std::string payload = Config::Trim(rest.substr(0, payloadEnd));
    if (payload.empty()) return Fail(err, ErrorCode::kInvalidRule, "missing payload for " + type, field);

    Predicate p;
    bool ok = false;
    if (type == "DOMAIN") {
        ok = MakePredicate(RuleField::kHost, "", RuleOp::kEquals, payload, &p, err, field);
    } else if (type == "DOMAIN-SUFFIX") {
        ok = MakePredicate(RuleField::kHost, "", RuleOp::kWildcard, "+." + payload, &p, err, field);
    } else if (type == "DOMAIN-KEYWORD") {
        ok = MakePredicate(RuleField::kHost, "", RuleOp::kContains, payload, &p, err, field);
    } else if (type == "DOMAIN-REGEX") {
        ok = MakePredicate(RuleField::kHost, "", RuleOp::kRegex, payload, &p, err, field);
    } else if (type == "DOMAIN-WILDCARD") {
        ok = MakePredicate(RuleField::kHost, "", RuleOp::kWildcard, payload, &p, err, field);
    } else if (type == "DST-PORT") {
        ok = MakePredicate(RuleField::kPort, "", RuleOp::kRange, payload, &p, err, field);
    } else if (type == "SRC-PORT") {
        ok = MakePredicate(RuleField::kClientPort, "", RuleOp::kRange, payload, &p, err, field);
    } else if (type == "IP-CIDR") {
        ok = MakePredicate(RuleField::kServerIp, "", RuleOp::kCidr, payload, &p, err, field);
    } else if (type == "SRC-IP-CIDR") {
        ok = MakePredicate(RuleField::kClientIp, "", RuleOp::kCidr, payload, &p, err, field);
    } else {
        return Fail(err, ErrorCode::kInvalidRule, "unsupported rule type '" + type + "'", field);
    }
    if (!ok) return false;
    out->push_back(std::move(p));
    return true;
}

bool RuleParser::ParseExpression(const std::string& expr,
                                 std::vector<Predicate>* out,
                                 Error* err,
                                 const std::string& field) {
    if (!out) return Fail(err, ErrorCode::kInvalidArgument, "null output", field);
    std::vector<Predicate> parsed;
    const std::string t = Config::Trim(expr);
    if (t.empty() || t == "*") {
        out->clear();
        return true;
    }
    if (LooksLikeClash(t)) {
        if (!ParseClashLine(t, &parsed, err, field)) return false;
    } else {
        for (const auto& clause : SplitOn(t, "&&")) {
            Predicate p;
            if (!ParseClause(clause, &p, err, field)) return false;
            parsed.push_back(std::move(p));
        }
    }
    *out = std::move(parsed);
    return true;
}

bool RuleParser::BuildRule(EventKind kind,
                           const std::string& expr,
                           int priority,
                           bool shortCircuit,
                           HookRule* out,
                           Error* err,
                           const std::string& field) {
    if (!out) return Fail(err, ErrorCode::kInvalidArgument, "null rule", field);
    HookRule rule;
    rule.kind = kind;
    rule.priority = priority;
    rule.shortCircuit = shortCircuit;
    rule.expression = Config::Trim(expr);
    if (!ParseExpression(expr, &rule.predicates, err, field)) return false;
    *out = std::move(rule);
    return true;
}

} // namespace core
} // namespace addonhub
