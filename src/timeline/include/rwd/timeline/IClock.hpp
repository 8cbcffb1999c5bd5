// /////////////////////////////////////////////////////////////////////////////
/// @file IClock.hpp
/// @brief Host-provided time source and repeating timer.
// /////////////////////////////////////////////////////////////////////////////
#pragma once

#include <rwd/core/Types.hpp>

#include <functional>

namespace rwd::timeline {

using TimerHandle = core::u64;

inline constexpr TimerHandle kInvalidTimer = 0;

// /////////////////////////////////////////////////////////////////////////////
/// @class IClock
/// @brief Strategy interface over the host's event loop timers.
///
/// All callbacks run on the host's single logical thread. cancel() may be
/// called from inside a firing callback; implementations must keep that
/// callback alive until it returns and must never fire it again afterwards.
// /////////////////////////////////////////////////////////////////////////////
class IClock
{
public:
    virtual ~IClock() = default;

    /// @brief Monotonic time in milliseconds.
    [[nodiscard]] virtual core::f64 nowMs() const noexcept = 0;

    /// @brief Fire @p callback roughly every @p intervalMs until cancelled.
    ///        Late ticks may coalesce into a single call.
    [[nodiscard]] virtual TimerHandle scheduleRepeating(core::f64 intervalMs,
                                                        std::function<void()> callback) = 0;

    /// @brief Cancel a timer. Unknown or already cancelled handles are ignored.
    virtual void cancel(TimerHandle handle) noexcept = 0;
};

} // namespace rwd::timeline
