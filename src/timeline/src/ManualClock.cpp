// /////////////////////////////////////////////////////////////////////////////
/// @file ManualClock.cpp
/// @brief ManualClock implementation.
// /////////////////////////////////////////////////////////////////////////////

#include <rwd/timeline/ManualClock.hpp>
#include <rwd/core/Assert.hpp>

namespace rwd::timeline {

ManualClock::ManualClock() = default;
ManualClock::~ManualClock() = default;

core::f64 ManualClock::nowMs() const noexcept
{
    return now_;
}

TimerHandle ManualClock::scheduleRepeating(core::f64 intervalMs, std::function<void()> callback)
{
    return timers_.schedule(now_, intervalMs, std::move(callback));
}

void ManualClock::cancel(TimerHandle handle) noexcept
{
    timers_.cancel(handle);
}

void ManualClock::advance(core::f64 ms)
{
    RWD_ASSERT(ms >= 0.0);
    now_ += ms;
    timers_.fire(now_);
}

void ManualClock::fireAll()
{
    timers_.fire(now_, false);
}

core::usize ManualClock::activeTimers() const noexcept
{
    return timers_.size();
}

} // namespace rwd::timeline
