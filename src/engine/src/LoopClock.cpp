// /////////////////////////////////////////////////////////////////////////////
/// @file LoopClock.cpp
/// @brief LoopClock implementation: polled timers over steady_clock.
// /////////////////////////////////////////////////////////////////////////////

#include <rwd/engine/LoopClock.hpp>
#include <rwd/core/Log.hpp>

#include <thread>

namespace rwd::engine {

LoopClock::LoopClock() : _origin{Clock::now()} {}

LoopClock::~LoopClock() = default;

core::f64 LoopClock::nowMs() const noexcept
{
    return std::chrono::duration<core::f64, std::milli>(Clock::now() - _origin).count();
}

timeline::TimerHandle LoopClock::scheduleRepeating(core::f64 intervalMs, std::function<void()> callback)
{
    return _timers.schedule(nowMs(), intervalMs, std::move(callback));
}

void LoopClock::cancel(timeline::TimerHandle handle) noexcept
{
    _timers.cancel(handle);
}

core::usize LoopClock::poll()
{
    return _timers.fire(nowMs());
}

void LoopClock::run(const std::function<void()>& idle)
{
    _running = true;

    while (_running && !_timers.empty())
    {
        if (idle)
            idle();

        poll();

        const core::f64 wait = _timers.nextDueMs() - nowMs();
        if (_running && !_timers.empty() && wait > 0.0)
            std::this_thread::sleep_for(std::chrono::duration<core::f64, std::milli>(wait));
    }

    _running = false;
    core::Log::debug("engine", "LoopClock: stopped");
}

void LoopClock::requestStop() noexcept
{
    _running = false;
}

bool LoopClock::isRunning() const noexcept
{
    return _running;
}

} // namespace rwd::engine
