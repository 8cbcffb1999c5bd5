// /////////////////////////////////////////////////////////////////////////////
/// @file TimelinePlayer.hpp
/// @brief Paced playback of a FrameSequence over a host clock.
///
/// The interpreter produces every frame up front; the player hands them to
/// the host one at a time, either on a steady cadence (start/pause) or on
/// explicit step requests.
// /////////////////////////////////////////////////////////////////////////////
#pragma once

#include <rwd/timeline/FrameSequence.hpp>
#include <rwd/timeline/IClock.hpp>
#include <rwd/core/Types.hpp>
#include <rwd/core/NonCopyable.hpp>

#include <functional>
#include <memory>

namespace rwd::timeline {

/// @brief Playback state.
enum class PlaybackState : core::u8
{
    Idle,
    Playing,
    Paused,
    Finished,
    Stopped
};

/// @brief Pacing parameters.
struct PlaybackTiming
{
    /// @brief Wall-clock duration of one frame during continuous play.
    core::f64 msPerStep{1000.0};

    /// @brief How often the player asks the clock to wake it up.
    core::f64 tickIntervalMs{16.0};
};

/// @brief Host notifications.
struct PlayerCallbacks
{
    /// @brief Called once per emitted frame, in cursor order.
    std::function<void(core::usize index, const Frame& frame)> onFrame;

    /// @brief Called exactly once when the cursor reaches the end.
    std::function<void()> onComplete;
};

/// @brief Cursor-driven replayer.
///
/// The cursor counts frames already emitted and lives in [0, length]; the
/// frame on display is cursor - 1. Continuous play derives the target cursor
/// from elapsed clock time, and emits every index between the old and new
/// cursor even when clock ticks coalesce.
///
/// Every scheduled tick carries a generation stamp and a weak reference to
/// the player state, so pause(), stop() and destruction neutralise ticks the
/// clock has already queued.
///
/// Callbacks may stop or destroy the player.
class TimelinePlayer final : public core::NonCopyable<TimelinePlayer>
{
public:
    /// @param frames    Sequence to play; owned by the player until stop().
    /// @param clock     Host clock; must outlive the player.
    /// @param timing    Pacing parameters.
    /// @param callbacks Host notifications.
    TimelinePlayer(FrameSequence frames,
                   IClock& clock,
                   PlaybackTiming timing,
                   PlayerCallbacks callbacks);
    ~TimelinePlayer();

    TimelinePlayer(TimelinePlayer&&) noexcept;
    TimelinePlayer& operator=(TimelinePlayer&&) noexcept;

    /// @brief Begin or resume continuous playback. No-op if already playing.
    void start();

    /// @brief Halt continuous playback, keeping the cursor. No-op unless playing.
    void pause();

    /// @brief Emit the next frame synchronously. No-op at the end.
    void stepForward();

    /// @brief Rewind one frame and re-emit the frame now on display.
    ///        No-op with fewer than two frames emitted.
    void stepBackward();

    /// @brief Cancel ticking and release the sequence. No callback fires afterwards.
    void stop();

    [[nodiscard]] core::usize cursor() const noexcept;
    [[nodiscard]] core::usize length() const noexcept;
    [[nodiscard]] PlaybackState state() const noexcept;
    [[nodiscard]] bool isRunning() const noexcept;
    [[nodiscard]] bool isFinished() const noexcept;

private:
    struct Impl;
    std::shared_ptr<Impl> impl_;
};

} // namespace rwd::timeline
