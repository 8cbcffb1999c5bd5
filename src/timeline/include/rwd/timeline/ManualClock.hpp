// /////////////////////////////////////////////////////////////////////////////
/// @file ManualClock.hpp
/// @brief Deterministic IClock whose time only moves when told to.
///
/// Used by tests and by hosts that drive playback from their own frame
/// callback. advance() fires every due timer at most once, so a large jump
/// reproduces the coalesced tick a stalled host event loop would deliver.
// /////////////////////////////////////////////////////////////////////////////
#pragma once

#include <rwd/timeline/IClock.hpp>
#include <rwd/timeline/TimerQueue.hpp>
#include <rwd/core/Types.hpp>

namespace rwd::timeline {

class ManualClock final : public IClock
{
public:
    ManualClock();
    ~ManualClock() override;

    ManualClock(const ManualClock&) = delete;
    ManualClock& operator=(const ManualClock&) = delete;

    [[nodiscard]] core::f64 nowMs() const noexcept override;
    [[nodiscard]] TimerHandle scheduleRepeating(core::f64 intervalMs,
                                                std::function<void()> callback) override;
    void cancel(TimerHandle handle) noexcept override;

    /// @brief Move time forward and fire each due timer once.
    void advance(core::f64 ms);

    /// @brief Fire every active timer once without moving time.
    void fireAll();

    /// @brief Number of timers still scheduled.
    [[nodiscard]] core::usize activeTimers() const noexcept;

private:
    core::f64 now_{0.0};
    TimerQueue timers_;
};

} // namespace rwd::timeline
