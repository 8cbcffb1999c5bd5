/**
 * @file LoopClock.hpp
 * @brief Wall-clock IClock with a blocking host loop.
 *
 * For hosts without an event loop of their own (terminal front-ends, tools).
 * Timers fire from poll() or run() on the calling thread; a timer that fell
 * several intervals behind fires once.
 */
#pragma once

#ifndef RWD_ENGINE_LOOPCLOCK_HPP
    #define RWD_ENGINE_LOOPCLOCK_HPP

#include <rwd/timeline/IClock.hpp>
#include <rwd/timeline/TimerQueue.hpp>
#include <rwd/core/Types.hpp>

#include <chrono>
#include <functional>

namespace rwd::engine {

/** @brief steady_clock-backed IClock. */
class LoopClock final : public timeline::IClock
{
public:
    LoopClock();
    ~LoopClock() override;

    LoopClock(const LoopClock&) = delete;
    LoopClock& operator=(const LoopClock&) = delete;

    [[nodiscard]] core::f64 nowMs() const noexcept override;
    [[nodiscard]] timeline::TimerHandle scheduleRepeating(core::f64 intervalMs,
                                                          std::function<void()> callback) override;
    void cancel(timeline::TimerHandle handle) noexcept override;

    /**
     * @brief Fire every due timer once.
     * @return Number of callbacks invoked.
     */
    core::usize poll();

    /**
     * @brief Poll until requestStop() is called or no timer remains.
     * @param idle Optional hook called once per loop iteration (input, redraw).
     */
    void run(const std::function<void()>& idle = {});

    /** @brief Request graceful loop termination. */
    void requestStop() noexcept;

    /** @brief Whether run() is currently looping. */
    [[nodiscard]] bool isRunning() const noexcept;

private:
    using Clock = std::chrono::steady_clock;

    Clock::time_point _origin;
    timeline::TimerQueue _timers;
    bool _running{false};
};

} // namespace rwd::engine

#endif // RWD_ENGINE_LOOPCLOCK_HPP
