#pragma once

#include "addonhub/common/Error.h"
#include "addonhub/core/TrafficEvent.h"

#include <cstdint>
#include <memory>
#include <regex>
#include <string>
#include <utility>
#include <vector>

namespace addonhub {
namespace core {

enum class RuleField {
    kHost,
    kPath,
    kMethod,
    kScheme,
    kPort,
    kClientIp,
    kClientPort,
    kServerIp,
    kContentType,
    kHeader,
};

enum class RuleOp {
    kEquals,
    kPrefix,
    kSuffix,
    kContains,
    kRegex,
    kWildcard,
    kRange,
    kCidr,
    kExists,
};

const char* RuleFieldName(RuleField field);
const char* RuleOpName(RuleOp op);

// One field comparison. Everything the matcher needs is precomputed here, so matching
// never parses or compiles anything.
struct Predicate {
    RuleField field{RuleField::kHost};
    std::string headerName;  // kHeader only
    RuleOp op{RuleOp::kEquals};
    std::string value;       // lowercased for host/method/scheme

    std::shared_ptr<const std::regex> regex;             // kRegex
    std::vector<std::pair<long, long>> ranges;           // kRange, inclusive bounds
    std::uint32_t network{0};                             // kCidr
    std::uint32_t mask{0};

    std::string ToString() const;
};

// Conjunction of predicates bound to one hook. Immutable once published.
struct HookRule {
    EventKind kind{EventKind::kRequest};
    std::vector<Predicate> predicates;  // empty => matches every event of `kind`
    int priority{0};
    bool shortCircuit{false};
    std::string expression;

    bool IsWildcard() const { return predicates.empty(); }
};

// Parses the rule language:
//   host suffix example.com && path prefix /api && header.X-Token exists
// and Clash-style lines such as "DOMAIN-SUFFIX,example.com" or
// "AND,((DOMAIN-KEYWORD,shop),(DST-PORT,443))".
class RuleParser {
public:
    // `field` names the configuration key in error reports.
    static bool ParseExpression(const std::string& expr,
                                std::vector<Predicate>* out,
                                common::Error* err,
                                const std::string& field = "rule");

    static bool BuildRule(EventKind kind,
                          const std::string& expr,
                          int priority,
                          bool shortCircuit,
                          HookRule* out,
                          common::Error* err,
                          const std::string& field = "rule");

    static bool MakePredicate(RuleField ruleField,
                              const std::string& headerName,
                              RuleOp op,
                              const std::string& value,
                              Predicate* out,
                              common::Error* err,
                              const std::string& field = "rule");

    static bool ParseField(const std::string& token, RuleField* out, std::string* headerName);
    static bool ParseOp(const std::string& token, RuleOp* out);

    static bool ParsePortRanges(const std::string& value, std::vector<std::pair<long, long>>* out);
    static bool ParseCidr(const std::string& cidr, std::uint32_t* network, std::uint32_t* mask);
    static bool ParseIpv4(const std::string& ip, std::uint32_t* out);

private:
    static bool ParseClause(const std::string& clause, Predicate* out, common::Error* err, const std::string& field);
    static bool ParseClashLine(const std::string& line, std::vector<Predicate>* out, common::Error* err, const std::string& field);
    static bool LooksLikeClash(const std::string& expr);
};

} // namespace core
} // namespace addonhub
