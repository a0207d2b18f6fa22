#include <catch2/catch_test_macros.hpp>
#include "proofline/backoff.hpp"
#include "proofline/clock.hpp"
#include "support/fakes.hpp"
#include <thread>

using namespace proofline;
using namespace proofline::testing;
using namespace std::chrono_literals;

TEST_CASE("Timestamps format as ISO 8601 UTC with milliseconds", "[clock]")
{
    REQUIRE(format_timestamp(at_ms(kEpochMs)) == "2026-01-01T00:00:00.000Z");
    REQUIRE(format_timestamp(at_ms(kEpochMs + 250)) == "2026-01-01T00:00:00.250Z");
    REQUIRE(format_timestamp(at_ms(0)) == "1970-01-01T00:00:00.000Z");

    auto parsed = parse_timestamp("2026-01-01T00:00:00.250Z");
    REQUIRE(parsed.has_value());
    REQUIRE(*parsed == at_ms(kEpochMs + 250));

    SECTION("Instants before the epoch keep a positive millisecond field")
    {
        REQUIRE(format_timestamp(at_ms(-250)) == "1969-12-31T23:59:59.750Z");
        REQUIRE(format_timestamp(at_ms(-1000)) == "1969-12-31T23:59:59.000Z");
        REQUIRE(format_timestamp(at_ms(-86400001)) == "1969-12-30T23:59:59.999Z");

        auto before = parse_timestamp("1969-12-31T23:59:59.750Z");
        REQUIRE(before.has_value());
        REQUIRE(*before == at_ms(-250));
        REQUIRE(format_timestamp(*before) == "1969-12-31T23:59:59.750Z");
    }

    SECTION("Only the exact form is accepted")
    {
        REQUIRE_FALSE(parse_timestamp("2026-01-01T00:00:00Z").has_value());
        REQUIRE_FALSE(parse_timestamp("2026-01-01 00:00:00.000Z").has_value());
        REQUIRE_FALSE(parse_timestamp("2026-02-30T00:00:00.000Z").has_value());
        REQUIRE_FALSE(parse_timestamp("2026-01-01T24:00:00.000Z").has_value());
        REQUIRE_FALSE(parse_timestamp("").has_value());
    }
}

TEST_CASE("Cancellation propagates from parent to children", "[clock]")
{
    CancellationToken parent;
    auto child = parent.child();
    auto grandchild = child.child();

    REQUIRE_FALSE(grandchild.is_cancelled());
    parent.cancel();
    REQUIRE(child.is_cancelled());
    REQUIRE(grandchild.is_cancelled());

    SECTION("Children of a cancelled token start cancelled")
    {
        REQUIRE(parent.child().is_cancelled());
    }
}

TEST_CASE("Released children do not accumulate on a long-lived parent", "[clock]")
{
    CancellationToken parent;
    for (int i = 0; i < 1000; ++i)
    {
        auto request = parent.child();
        auto nested = request.child();
    }

    auto live = parent.child();
    REQUIRE(parent.registered_children() == 1);

    parent.cancel();
    REQUIRE(live.is_cancelled());
}

TEST_CASE("Cancelling a child leaves the parent running", "[clock]")
{
    CancellationToken parent;
    auto child = parent.child();
    child.cancel();
    REQUIRE(child.is_cancelled());
    REQUIRE_FALSE(parent.is_cancelled());
}

TEST_CASE("Copies of a token share state", "[clock]")
{
    CancellationToken token;
    CancellationToken copy = token;
    copy.cancel();
    REQUIRE(token.is_cancelled());
}

TEST_CASE("Wake interrupts a wait without cancelling", "[clock]")
{
    CancellationToken token;
    token.wake();
    REQUIRE(token.wait_for(10s) == WaitResult::Woken);
    REQUIRE_FALSE(token.is_cancelled());
    REQUIRE_FALSE(token.take_wake());

    token.wake();
    REQUIRE(token.take_wake());
    REQUIRE_FALSE(token.take_wake());

    REQUIRE(token.wait_for(1ms) == WaitResult::Elapsed);
}

TEST_CASE("System clock sleep returns early on cancel", "[clock]")
{
    SystemClock clock;
    CancellationToken token;

    std::thread canceller([token]() {
        std::this_thread::sleep_for(20ms);
        token.cancel();
    });

    auto started = std::chrono::steady_clock::now();
    auto result = clock.sleep_for(60s, token);
    canceller.join();

    REQUIRE(result == WaitResult::Cancelled);
    REQUIRE(std::chrono::steady_clock::now() - started < 30s);
}

TEST_CASE("Manual clock advances only when slept on", "[clock]")
{
    ManualClock clock;
    CancellationToken token;
    REQUIRE(clock.now() == at_ms(kEpochMs));

    REQUIRE(clock.sleep_for(5s, token) == WaitResult::Elapsed);
    REQUIRE(clock.now() == at_ms(kEpochMs + 5000));

    token.cancel();
    REQUIRE(clock.sleep_for(5s, token) == WaitResult::Cancelled);
    REQUIRE(clock.now() == at_ms(kEpochMs + 5000));
}

TEST_CASE("Backoff grows geometrically up to its cap", "[clock][backoff]")
{
    BackoffPolicy policy{100ms, 1000ms, 2.0, 4};
    REQUIRE(policy.delay_for(1) == 100ms);
    REQUIRE(policy.delay_for(2) == 200ms);
    REQUIRE(policy.delay_for(4) == 800ms);
    REQUIRE(policy.delay_for(5) == 1000ms);
    REQUIRE(policy.delay_for(40) == 1000ms);

    REQUIRE_FALSE(policy.exhausted(3));
    REQUIRE(policy.exhausted(4));
}
