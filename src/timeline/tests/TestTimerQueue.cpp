/**
 * @file TestTimerQueue.cpp
 * @brief Unit tests for timeline::TimerQueue.
 */

#include <catch2/catch_test_macros.hpp>

#include "rwd/timeline/TimerQueue.hpp"

#include <cmath>

namespace rwd::timeline {

TEST_CASE("TimerQueue reports the earliest due time", "[timeline][timers]")
{
    TimerQueue queue;

    REQUIRE(queue.empty());
    REQUIRE(std::isinf(queue.nextDueMs()));

    const auto slow = queue.schedule(0.0, 50.0, []() {});
    (void)queue.schedule(0.0, 20.0, []() {});
    REQUIRE(queue.size() == 2);
    REQUIRE(queue.nextDueMs() == 20.0);

    queue.cancel(slow);
    queue.cancel(slow);
    REQUIRE(queue.size() == 1);
}

TEST_CASE("TimerQueue fires a late timer once and reschedules from now", "[timeline][timers]")
{
    TimerQueue queue;
    int fired = 0;

    (void)queue.schedule(0.0, 10.0, [&]() { ++fired; });

    REQUIRE(queue.fire(5.0) == 0);
    REQUIRE(queue.fire(95.0) == 1);
    REQUIRE(fired == 1);
    REQUIRE(queue.nextDueMs() == 105.0);

    REQUIRE(queue.fire(95.0, false) == 1);
    REQUIRE(fired == 2);
}

} // namespace rwd::timeline
