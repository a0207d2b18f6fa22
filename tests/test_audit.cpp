#include <catch2/catch_test_macros.hpp>
#include "proofline/audit.hpp"
#include "proofline/logging.hpp"
#include "support/fakes.hpp"
#include <fstream>
#include <limits>

using namespace proofline;
using namespace proofline::testing;
using Json = nlohmann::json;

namespace
{
    AuditEvent event(const std::string &stage, const std::string &result, int64_t offset_ms = 0)
    {
        AuditEvent e;
        e.ts = at_ms(kEpochMs + offset_ms);
        e.stage = stage;
        e.action = stage + "_done";
        e.subject = "b00c64c4";
        e.result = result;
        return e;
    }
}

TEST_CASE("Audit trail links events into a hash chain", "[audit]")
{
    AuditTrail trail;
    REQUIRE_FALSE(trail.head().has_value());

    auto first = trail.append(event("canonicalize", "ok"));
    REQUIRE(first.has_value());
    REQUIRE(first->size() == 64);
    REQUIRE(*first == AuditTrail::link("", event("canonicalize", "ok")).value());

    auto second = trail.append(event("oracle", "finalized", 10));
    REQUIRE(second.has_value());
    REQUIRE(*second == AuditTrail::link(*first, event("oracle", "finalized", 10)).value());
    REQUIRE(trail.head() == *second);
    REQUIRE(trail.hashes() == std::vector<std::string>{*first, *second});
    REQUIRE(trail.events().size() == 2);
    REQUIRE(trail.verify().has_value());
}

TEST_CASE("Audit links depend on order and content", "[audit]")
{
    auto a = event("oracle", "finalized");
    auto b = event("tracker", "confirmed");

    auto ab = AuditTrail::link(AuditTrail::link("", a).value(), b).value();
    auto ba = AuditTrail::link(AuditTrail::link("", b).value(), a).value();
    REQUIRE(ab != ba);

    auto edited = a;
    edited.details = Json{{"polls", 4}};
    REQUIRE(AuditTrail::link("", a).value() != AuditTrail::link("", edited).value());
}

TEST_CASE("Audit events must have a canonical form", "[audit]")
{
    AuditTrail trail;
    auto e = event("assemble", "confirmed");
    e.details = Json{{"ratio", std::numeric_limits<double>::quiet_NaN()}};

    auto res = trail.append(e);
    REQUIRE_FALSE(res.has_value());
    REQUIRE(res.error().stage == "audit");
    REQUIRE(trail.events().empty());
}

TEST_CASE("Audit events are written to the audit log file", "[audit][logging]")
{
    TempDir dir;
    LoggingConfig cfg;
    cfg.audit_log = (dir.path() / "audit.log").string();

    auto logger = make_audit_logger(cfg);
    REQUIRE(logger.has_value());

    {
        AuditTrail trail(*logger);
        auto hash = trail.append(event("verify", "verified"));
        REQUIRE(hash.has_value());

        std::ifstream in(*cfg.audit_log);
        std::string line;
        REQUIRE(std::getline(in, line));
        auto j = Json::parse(line);
        REQUIRE(j["stage"] == "verify");
        REQUIRE(j["result"] == "verified");
        REQUIRE(j["ts"] == "2026-01-01T00:00:00.000Z");
        REQUIRE(j["chain_hash"] == *hash);
    }

    spdlog::drop("audit");
}

TEST_CASE("Without an audit log path events go to the default logger", "[audit][logging]")
{
    LoggingConfig cfg;
    auto logger = make_audit_logger(cfg);
    REQUIRE(logger.has_value());
    REQUIRE(*logger == spdlog::default_logger());
}
