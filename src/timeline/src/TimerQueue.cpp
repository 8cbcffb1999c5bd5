// /////////////////////////////////////////////////////////////////////////////
/// @file TimerQueue.cpp
/// @brief TimerQueue implementation.
// /////////////////////////////////////////////////////////////////////////////

#include <rwd/timeline/TimerQueue.hpp>
#include <rwd/core/Assert.hpp>

#include <algorithm>
#include <limits>
#include <vector>

namespace rwd::timeline {

TimerQueue::TimerQueue() = default;
TimerQueue::~TimerQueue() = default;

TimerHandle TimerQueue::schedule(core::f64 nowMs, core::f64 intervalMs, std::function<void()> callback)
{
    RWD_ASSERT(intervalMs > 0.0);

    const TimerHandle handle = nextHandle_++;
    Timer timer;
    timer.intervalMs = intervalMs;
    timer.nextDueMs = nowMs + intervalMs;
    timer.callback = std::make_shared<std::function<void()>>(std::move(callback));
    timers_.emplace(handle, std::move(timer));
    return handle;
}

void TimerQueue::cancel(TimerHandle handle) noexcept
{
    timers_.erase(handle);
}

core::usize TimerQueue::fire(core::f64 nowMs, bool onlyDue)
{
    std::vector<TimerHandle> handles;
    handles.reserve(timers_.size());
    for (const auto& [handle, timer] : timers_)
        handles.push_back(handle);

    core::usize fired = 0;
    for (const TimerHandle handle : handles)
    {
        auto it = timers_.find(handle);
        if (it == timers_.end())
            continue;
        if (onlyDue && it->second.nextDueMs > nowMs)
            continue;

        it->second.nextDueMs = nowMs + it->second.intervalMs;
        // The copy outlives a cancel() issued by the callback itself.
        const auto callback = it->second.callback;
        (*callback)();
        ++fired;
    }
    return fired;
}

core::f64 TimerQueue::nextDueMs() const noexcept
{
    core::f64 next = std::numeric_limits<core::f64>::infinity();
    for (const auto& [handle, timer] : timers_)
        next = std::min(next, timer.nextDueMs);
    return next;
}

bool TimerQueue::empty() const noexcept
{
    return timers_.empty();
}

core::usize TimerQueue::size() const noexcept
{
    return timers_.size();
}

} // namespace rwd::timeline
