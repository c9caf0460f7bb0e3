#include "addonhub/core/RuleMatcher.h"
#include "addonhub/common/Logger.h"

#include <cassert>
#include <string>

using addonhub::common::Error;
using addonhub::core::EventAttributes;
using addonhub::core::EventKind;
using addonhub::core::HookRule;
using addonhub::core::RuleMatcher;
using addonhub::core::RuleParser;
using addonhub::core::TrafficEvent;

static HookRule rule(EventKind kind, const std::string& expr) {
    HookRule r;
    Error err;
    const bool ok = RuleParser::BuildRule(kind, expr, 0, false, &r, &err);
    assert(ok);
    assert(RuleMatcher::Validate(r, &err));
    return r;
}

static EventAttributes attrs() {
    EventAttributes a;
    a.method = "POST";
    a.scheme = "https";
    a.host = "API.Example.com";
    a.port = 443;
    a.path = "/v2/orders";
    a.query = "page=2";
    a.contentType = "application/json";
    a.headers = {{"X-Token", "abc"}, {"User-Agent", "curl/8.0"}};
    a.clientIp = "10.1.2.3";
    a.clientPort = 51234;
    a.serverIp = "93.184.216.34";
    return a;
}

int main() {
    addonhub::common::Logger::Instance().SetLevel(addonhub::common::LogLevel::ERROR);
    const EventAttributes a = attrs();

    // Event kind mismatch never matches, even for a wildcard rule.
    {
        HookRule any = rule(EventKind::kRequest, "");
        assert(RuleMatcher::Matches(any, EventKind::kRequest, a));
        assert(!RuleMatcher::Matches(any, EventKind::kResponse, a));
        TrafficEvent ev(EventKind::kRequestHeaders, "f", a);
        assert(!RuleMatcher::Matches(any, ev));
    }

    // Host comparisons ignore case; path comparisons do not.
    {
        assert(RuleMatcher::Matches(rule(EventKind::kRequest, "host == api.example.COM"), EventKind::kRequest, a));
        assert(RuleMatcher::Matches(rule(EventKind::kRequest, "host suffix example.com"), EventKind::kRequest, a));
        assert(RuleMatcher::Matches(rule(EventKind::kRequest, "host prefix api."), EventKind::kRequest, a));
        assert(RuleMatcher::Matches(rule(EventKind::kRequest, "host contains EXAMPLE"), EventKind::kRequest, a));
        assert(RuleMatcher::Matches(rule(EventKind::kRequest, "path prefix /v2"), EventKind::kRequest, a));
        assert(!RuleMatcher::Matches(rule(EventKind::kRequest, "path prefix /V2"), EventKind::kRequest, a));
        assert(RuleMatcher::Matches(rule(EventKind::kRequest, "method == post"), EventKind::kRequest, a));
        assert(RuleMatcher::Matches(rule(EventKind::kRequest, "scheme == HTTPS"), EventKind::kRequest, a));
        assert(RuleMatcher::Matches(rule(EventKind::kRequest, "content_type prefix application/"),
                                    EventKind::kRequest, a));
    }

    // Conjunction: every predicate must hold.
    {
        assert(RuleMatcher::Matches(rule(EventKind::kRequest, "host suffix example.com && path prefix /v2"),
                                    EventKind::kRequest, a));
        assert(!RuleMatcher::Matches(rule(EventKind::kRequest, "host suffix example.com && path prefix /v1"),
                                     EventKind::kRequest, a));
    }

    // Headers: names are case-insensitive, values are not.
    {
        assert(RuleMatcher::Matches(rule(EventKind::kRequest, "header.x-token exists"), EventKind::kRequest, a));
        assert(!RuleMatcher::Matches(rule(EventKind::kRequest, "header.X-Missing exists"), EventKind::kRequest, a));
        assert(RuleMatcher::Matches(rule(EventKind::kRequest, "header.user-agent prefix curl/"),
                                    EventKind::kRequest, a));
        assert(!RuleMatcher::Matches(rule(EventKind::kRequest, "header.X-Token == ABC"), EventKind::kRequest, a));
        assert(!RuleMatcher::Matches(rule(EventKind::kRequest, "header.X-Missing == abc"), EventKind::kRequest, a));
    }

    // Regex is anchored at the start of the subject.
    {
        assert(RuleMatcher::Matches(rule(EventKind::kRequest, "path ~ /v[0-9]+/"), EventKind::kRequest, a));
        assert(!RuleMatcher::Matches(rule(EventKind::kRequest, "path ~ orders"), EventKind::kRequest, a));
        assert(RuleMatcher::Matches(rule(EventKind::kRequest, "path ~ .*orders$"), EventKind::kRequest, a));
        assert(RuleMatcher::Matches(rule(EventKind::kRequest, "DOMAIN-REGEX,^api\\."), EventKind::kRequest, a));
    }

    // Ports and networks.
    {
        assert(RuleMatcher::Matches(rule(EventKind::kRequest, "port == 443"), EventKind::kRequest, a));
        assert(RuleMatcher::Matches(rule(EventKind::kRequest, "port range 80,440-450"), EventKind::kRequest, a));
        assert(!RuleMatcher::Matches(rule(EventKind::kRequest, "port range 80-90"), EventKind::kRequest, a));
        assert(RuleMatcher::Matches(rule(EventKind::kRequest, "SRC-PORT,50000-60000"), EventKind::kRequest, a));
        assert(RuleMatcher::Matches(rule(EventKind::kRequest, "client_ip cidr 10.0.0.0/8"), EventKind::kRequest, a));
        assert(!RuleMatcher::Matches(rule(EventKind::kRequest, "client_ip cidr 192.168.0.0/16"),
                                     EventKind::kRequest, a));
        assert(RuleMatcher::Matches(rule(EventKind::kRequest, "IP-CIDR,93.184.216.0/24"), EventKind::kRequest, a));
        EventAttributes noIp = a;
        noIp.serverIp.clear();
        assert(!RuleMatcher::Matches(rule(EventKind::kRequest, "IP-CIDR,0.0.0.0/0"), EventKind::kRequest, noIp));
    }

    // Domain wildcard forms.
    {
        assert(RuleMatcher::MatchDomainWildcard("*.a.com", "x.a.com"));
        assert(!RuleMatcher::MatchDomainWildcard("*.a.com", "a.com"));
        assert(!RuleMatcher::MatchDomainWildcard("*.a.com", "y.x.a.com"));
        assert(RuleMatcher::MatchDomainWildcard("+.a.com", "a.com"));
        assert(RuleMatcher::MatchDomainWildcard("+.a.com", "y.x.A.com"));
        assert(!RuleMatcher::MatchDomainWildcard("+.a.com", "ba.com"));
        assert(RuleMatcher::MatchDomainWildcard(".a.com", "x.a.com"));
        assert(!RuleMatcher::MatchDomainWildcard(".a.com", "a.com"));
        assert(RuleMatcher::MatchDomainWildcard("api.*.com", "api.example.com"));
        assert(!RuleMatcher::MatchDomainWildcard("api.*.com", "www.example.com"));
        assert(RuleMatcher::Matches(rule(EventKind::kRequest, "DOMAIN-SUFFIX,example.com"), EventKind::kRequest, a));
        assert(RuleMatcher::Matches(rule(EventKind::kRequest, "AND,((DOMAIN-KEYWORD,api),(DST-PORT,443))"),
                                    EventKind::kRequest, a));
        assert(!RuleMatcher::Matches(rule(EventKind::kRequest, "AND,((DOMAIN-KEYWORD,api),(DST-PORT,80))"),
                                     EventKind::kRequest, a));
    }

    // Glob over non-host fields.
    {
        assert(RuleMatcher::GlobMatch("/v*/ord?rs", "/v2/ord?rs", false));
        assert(RuleMatcher::Matches(rule(EventKind::kRequest, "path wildcard /v*/orders"), EventKind::kRequest, a));
        assert(!RuleMatcher::Matches(rule(EventKind::kRequest, "path wildcard /v*/users"), EventKind::kRequest, a));
    }

    // Hand-built predicates without their precomputed data fail validation.
    {
        HookRule r = rule(EventKind::kRequest, "path ~ ^/x");
        r.predicates[0].regex.reset();
        Error err;
        assert(!RuleMatcher::Validate(r, &err, "hook.h.rule"));
        assert(err.field == "hook.h.rule");
        assert(!RuleMatcher::Matches(r, EventKind::kRequest, a));
    }
    // Regex predicates skip subjects past the length limit instead of recursing through them.
    {
        HookRule api = rule(EventKind::kRequest, "path ~ /api/.*");
        EventAttributes big = attrs();
        big.path = "/api/" + std::string(100 * 1024, 'x');
        assert(!RuleMatcher::Matches(api, EventKind::kRequest, big));
        assert(!RuleMatcher::Matches(api, EventKind::kRequest, big));

        EventAttributes small = attrs();
        small.path = "/api/items";
        assert(RuleMatcher::Matches(api, EventKind::kRequest, small));

        assert(RuleMatcher::RegexSubjectLimit() == RuleMatcher::kDefaultRegexSubjectLimit);
        RuleMatcher::SetRegexSubjectLimit(8);
        assert(!RuleMatcher::Matches(api, EventKind::kRequest, small));
        // Non-regex operators are not limited.
        assert(RuleMatcher::Matches(rule(EventKind::kRequest, "path prefix /api/"), EventKind::kRequest, big));
        RuleMatcher::SetRegexSubjectLimit(RuleMatcher::kDefaultRegexSubjectLimit);
        assert(RuleMatcher::Matches(api, EventKind::kRequest, small));
    }
    return 0;
}
