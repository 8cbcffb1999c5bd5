// /////////////////////////////////////////////////////////////////////////////
/// @file TimerQueue.hpp
/// @brief Repeating-timer bookkeeping shared by the IClock implementations.
///
/// Owns no time source: callers pass the current time in. Callbacks may
/// cancel or schedule timers while firing; timers scheduled during a pass
/// wait for the next one.
// /////////////////////////////////////////////////////////////////////////////
#pragma once

#include <rwd/timeline/IClock.hpp>
#include <rwd/core/Types.hpp>

#include <functional>
#include <map>
#include <memory>

namespace rwd::timeline {

class TimerQueue
{
public:
    TimerQueue();
    ~TimerQueue();

    TimerQueue(const TimerQueue&) = delete;
    TimerQueue& operator=(const TimerQueue&) = delete;

    /// @brief Register a timer first due at @p nowMs + @p intervalMs.
    [[nodiscard]] TimerHandle schedule(core::f64 nowMs, core::f64 intervalMs,
                                       std::function<void()> callback);

    void cancel(TimerHandle handle) noexcept;

    /// @brief Fire each timer due at @p nowMs once, or every timer when
    ///        @p onlyDue is false. Fired timers are rescheduled from @p nowMs.
    /// @return Number of callbacks invoked.
    core::usize fire(core::f64 nowMs, bool onlyDue = true);

    /// @brief Earliest due time, or +infinity when empty.
    [[nodiscard]] core::f64 nextDueMs() const noexcept;

    [[nodiscard]] bool empty() const noexcept;
    [[nodiscard]] core::usize size() const noexcept;

private:
    struct Timer
    {
        core::f64 intervalMs{0.0};
        core::f64 nextDueMs{0.0};
        std::shared_ptr<std::function<void()>> callback;
    };

    TimerHandle nextHandle_{kInvalidTimer + 1};
    std::map<TimerHandle, Timer> timers_;
};

} // namespace rwd::timeline
