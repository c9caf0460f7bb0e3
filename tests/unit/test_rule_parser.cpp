#include "addonhub/core/HookRule.h"
#include "addonhub/common/Logger.h"

#include <cassert>
#include <string>
#include <vector>

using addonhub::common::Error;
using addonhub::common::ErrorCode;
using addonhub::core::EventKind;
using addonhub::core::HookRule;
using addonhub::core::Predicate;
using addonhub::core::RuleField;
using addonhub::core::RuleOp;
using addonhub::core::RuleParser;

static std::vector<Predicate> parse(const std::string& expr) {
    std::vector<Predicate> out;
    Error err;
    const bool ok = RuleParser::ParseExpression(expr, &out, &err);
    assert(ok);
    assert(err.ok());
    return out;
}

static Error parseError(const std::string& expr, const std::string& field = "rule") {
    std::vector<Predicate> out;
    Error err;
    const bool ok = RuleParser::ParseExpression(expr, &out, &err, field);
    assert(!ok);
    return err;
}

int main() {
    addonhub::common::Logger::Instance().SetLevel(addonhub::common::LogLevel::ERROR);

    // Empty and "*" are wildcards.
    {
        assert(parse("").empty());
        assert(parse("  * ").empty());
        HookRule rule;
        assert(RuleParser::BuildRule(EventKind::kRequest, "", 5, true, &rule, nullptr));
        assert(rule.IsWildcard());
        assert(rule.priority == 5);
        assert(rule.shortCircuit);
    }

    // Conjunction of clauses, values lowercased for host.
    {
        auto ps = parse("host suffix Example.COM && path prefix /api && method == post");
        assert(ps.size() == 3);
        assert(ps[0].field == RuleField::kHost && ps[0].op == RuleOp::kSuffix && ps[0].value == "example.com");
        assert(ps[1].field == RuleField::kPath && ps[1].op == RuleOp::kPrefix && ps[1].value == "/api");
        assert(ps[2].field == RuleField::kMethod && ps[2].op == RuleOp::kEquals && ps[2].value == "post");
    }

    // Header predicates keep the header name; quoted values may contain spaces.
    {
        auto ps = parse("header.X-Token exists && header.User-Agent contains \"Mozilla 5\"");
        assert(ps.size() == 2);
        assert(ps[0].field == RuleField::kHeader && ps[0].headerName == "X-Token" && ps[0].op == RuleOp::kExists);
        assert(ps[1].headerName == "User-Agent" && ps[1].value == "Mozilla 5");
    }

    // Ports, CIDR and regex carry precomputed data.
    {
        auto ps = parse("port range 80,443,8000-8100 && client_ip cidr 10.0.0.0/8 && path ~ ^/v[0-9]+/");
        assert(ps.size() == 3);
        assert(ps[0].ranges.size() == 3);
        assert(ps[0].ranges[2].first == 8000 && ps[0].ranges[2].second == 8100);
        assert(ps[1].mask == 0xFF000000u);
        assert(ps[1].network == 0x0A000000u);
        assert(ps[2].regex != nullptr);
    }

    // Unknown fields and operators are rejected with the configured field name.
    {
        Error e = parseError("hostname equals a.com", "hook.inject.rule");
        assert(e.code == ErrorCode::kInvalidRule);
        assert(e.field == "hook.inject.rule");
        assert(e.message.find("hostname") != std::string::npos);

        e = parseError("host resembles a.com");
        assert(e.code == ErrorCode::kInvalidRule);
        assert(e.message.find("resembles") != std::string::npos);
    }

    // Operator/field mismatches and malformed values.
    {
        assert(parseError("host exists").code == ErrorCode::kInvalidRule);
        assert(parseError("path range 1-2").code == ErrorCode::kInvalidRule);
        assert(parseError("host cidr 10.0.0.0/8").code == ErrorCode::kInvalidRule);
        assert(parseError("port range 70000").code == ErrorCode::kInvalidRule);
        assert(parseError("port range 90-80").code == ErrorCode::kInvalidRule);
        assert(parseError("client_ip cidr 10.0.0.0/40").code == ErrorCode::kInvalidRule);
        assert(parseError("path regex ([a-z").code == ErrorCode::kInvalidRule);
        assert(parseError("path prefix").code == ErrorCode::kInvalidRule);
        assert(parseError("host suffix a.com && ").code == ErrorCode::kInvalidRule);
        assert(parseError("header.X-A exists yes").code == ErrorCode::kInvalidRule);
    }

    // Clash-style lines map to single predicates.
    {
        auto ps = parse("DOMAIN-SUFFIX,example.com,DIRECT");
        assert(ps.size() == 1);
        assert(ps[0].field == RuleField::kHost && ps[0].op == RuleOp::kWildcard && ps[0].value == "+.example.com");

        ps = parse("DOMAIN,www.example.com");
        assert(ps[0].op == RuleOp::kEquals && ps[0].value == "www.example.com");

        ps = parse("DOMAIN-KEYWORD,shop");
        assert(ps[0].op == RuleOp::kContains);

        ps = parse("DST-PORT,80/443");
        assert(ps[0].field == RuleField::kPort && ps[0].ranges.size() == 2);

        ps = parse("SRC-IP-CIDR,192.168.0.0/16");
        assert(ps[0].field == RuleField::kClientIp && ps[0].op == RuleOp::kCidr);

        ps = parse("IP-CIDR,1.2.3.4/32,no-resolve");
        assert(ps[0].field == RuleField::kServerIp);

        assert(parse("MATCH").empty());
    }

    // AND of Clash conditions becomes a conjunction.
    {
        auto ps = parse("AND,((DOMAIN-KEYWORD,shop),(DST-PORT,443))");
        assert(ps.size() == 2);
        assert(ps[0].field == RuleField::kHost);
        assert(ps[1].field == RuleField::kPort);
    }

    // Only conjunctions are supported.
    {
        assert(parseError("OR,((DOMAIN,a.com),(DOMAIN,b.com))").code == ErrorCode::kInvalidRule);
        assert(parseError("AND,((DOMAIN,a.com)").code == ErrorCode::kInvalidRule);
        assert(parseError("GEOIP,CN").code == ErrorCode::kInvalidRule);
        assert(parseError("DOMAIN,").code == ErrorCode::kInvalidRule);
    }

    // Port and CIDR helpers.
    {
        std::vector<std::pair<long, long>> r;
        assert(RuleParser::ParsePortRanges("8080", &r) && r.size() == 1 && r[0].first == 8080);
        assert(!RuleParser::ParsePortRanges("", &r));
        assert(!RuleParser::ParsePortRanges("80,,81", &r));
        std::uint32_t net = 0, mask = 0;
        assert(RuleParser::ParseCidr("192.168.1.7", &net, &mask));
        assert(mask == 0xFFFFFFFFu);
        assert(RuleParser::ParseCidr("0.0.0.0/0", &net, &mask) && mask == 0);
        assert(!RuleParser::ParseCidr("::1/128", &net, &mask));
    }
    return 0;
}
