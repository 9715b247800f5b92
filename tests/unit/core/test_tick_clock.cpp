/**
 * @file test_tick_clock.cpp
 * @brief Unit tests for TickClock pacing and ShutdownSignal
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <automind/shutdown_signal.h>
#include <automind/tick_clock.h>

#include <chrono>
#include <thread>

using namespace automind;
using Catch::Matchers::WithinAbs;

TEST_CASE("TickClock period", "[core][clock]") {
    TickClock clock(60.0);

    REQUIRE_THAT(clock.rate(), WithinAbs(60.0, 0.0001));
    double period = std::chrono::duration<double>(clock.period()).count();
    REQUIRE_THAT(period, WithinAbs(1.0 / 60.0, 1e-6));

    SECTION("rate below one is clamped") {
        TickClock slow(0.0);
        REQUIRE_THAT(slow.rate(), WithinAbs(1.0, 0.0001));
    }
}

TEST_CASE("TickClock paces ticks", "[core][clock]") {
    TickClock clock(100.0);

    for (int i = 0; i < 10; i++) {
        clock.waitForNextTick();
    }

    REQUIRE(clock.tickIndex() >= 10);
    // Ten 10ms deadlines cannot pass in less than 100ms
    REQUIRE(clock.elapsed() >= 0.095);
}

TEST_CASE("TickClock skips ticks after a stall", "[core][clock]") {
    TickClock clock(100.0);

    std::this_thread::sleep_for(std::chrono::milliseconds(55));
    uint64_t skipped = clock.waitForNextTick();

    REQUIRE(skipped >= 3);
    REQUIRE(clock.skippedTicks() == skipped);
    // The next deadline lies in the future again
    REQUIRE(clock.tickIndex() >= 5);
}

TEST_CASE("ShutdownSignal is idempotent", "[core][shutdown]") {
    ShutdownSignal signal;
    REQUIRE_FALSE(signal.raised());

    REQUIRE(signal.raise());
    REQUIRE(signal.raised());

    SECTION("later raises report they were not first") {
        REQUIRE_FALSE(signal.raise());
        REQUIRE_FALSE(signal.raise());
        REQUIRE(signal.raised());
    }
}
