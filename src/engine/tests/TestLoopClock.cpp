/**
 * @file TestLoopClock.cpp
 * @brief Unit tests for engine::LoopClock.
 */

#include <catch2/catch_test_macros.hpp>

#include "rwd/engine/LoopClock.hpp"

namespace rwd::engine {

TEST_CASE("LoopClock run returns once every timer is cancelled", "[engine][clock]")
{
    LoopClock clock;
    int fired = 0;
    timeline::TimerHandle handle = timeline::kInvalidTimer;

    handle = clock.scheduleRepeating(1.0, [&]() {
        if (++fired == 3)
            clock.cancel(handle);
    });

    clock.run();

    REQUIRE(fired == 3);
    REQUIRE_FALSE(clock.isRunning());
    REQUIRE(clock.nowMs() >= 3.0);
}

TEST_CASE("LoopClock requestStop ends the loop with timers pending", "[engine][clock]")
{
    LoopClock clock;
    int fired = 0;

    const auto handle = clock.scheduleRepeating(1.0, [&]() {
        ++fired;
        clock.requestStop();
    });

    clock.run();
    REQUIRE(fired == 1);

    clock.cancel(handle);
    REQUIRE(clock.poll() == 0);
}

} // namespace rwd::engine
