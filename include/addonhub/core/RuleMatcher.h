#pragma once

#include "addonhub/common/Error.h"
#include "addonhub/core/HookRule.h"
#include "addonhub/core/TrafficEvent.h"

#include <cstddef>
#include <string>

namespace addonhub {
namespace core {

// Stateless predicate evaluation. Matching never fails: rules are validated
// before they are published, so an unusable predicate simply does not match.
class RuleMatcher {
public:
    static bool Matches(const HookRule& rule, const TrafficEvent& event);
    static bool Matches(const HookRule& rule, EventKind kind, const EventAttributes& attrs);
    static bool EvalPredicate(const Predicate& p, const EventAttributes& attrs);

    // Regex predicates do not match subjects longer than this; std::regex recursion
    // depth grows with the subject length.
    static constexpr size_t kDefaultRegexSubjectLimit = 8192;
    static void SetRegexSubjectLimit(size_t limit);
    static size_t RegexSubjectLimit();

    // Publish-time check that every predicate uses a known field/operator pairing
    // with its precomputed data in place.
    static bool Validate(const HookRule& rule, common::Error* err, const std::string& field = "rule");

    // Domain wildcard semantics:
    //   "*.a.com"  one extra label        ("x.a.com", not "a.com" or "y.x.a.com")
    //   "+.a.com"  a.com and any subdomain
    //   ".a.com"   any subdomain, not a.com
    //   otherwise  '*' glob over the whole host
    static bool MatchDomainWildcard(const std::string& pattern, const std::string& host);
    static bool GlobMatch(const std::string& pattern, const std::string& text, bool ignoreCase);
};

} // namespace core
} // namespace addonhub
