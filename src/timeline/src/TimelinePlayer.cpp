// /////////////////////////////////////////////////////////////////////////////
/// @file TimelinePlayer.cpp
/// @brief TimelinePlayer implementation.
// /////////////////////////////////////////////////////////////////////////////

#include <rwd/timeline/TimelinePlayer.hpp>
#include <rwd/core/Assert.hpp>
#include <rwd/core/Log.hpp>

#include <algorithm>
#include <cmath>
#include <string>

namespace rwd::timeline {

struct TimelinePlayer::Impl
{
    FrameSequence frames;
    IClock& clock;
    PlaybackTiming timing;
    PlayerCallbacks callbacks;

    PlaybackState state{PlaybackState::Idle};
    core::usize cursor{0};
    bool completed{false};

    TimerHandle timer{kInvalidTimer};
    core::u64 generation{0};

    // Continuous play measures elapsed time from this anchor.
    core::f64 anchorMs{0.0};
    core::usize anchorCursor{0};

    Impl(FrameSequence seq, IClock& clk, PlaybackTiming t, PlayerCallbacks cb)
        : frames{std::move(seq)}, clock{clk}, timing{t}, callbacks{std::move(cb)}
    {
    }

    void cancelTimer() noexcept
    {
        if (timer != kInvalidTimer)
        {
            clock.cancel(timer);
            timer = kInvalidTimer;
        }
        ++generation;
    }

    void reanchor() noexcept
    {
        anchorMs = clock.nowMs();
        anchorCursor = cursor;
    }

    /// @return false when a callback invalidated this generation.
    bool emit(core::usize index, core::u64 gen)
    {
        if (callbacks.onFrame)
            callbacks.onFrame(index, frames[index]);
        return generation == gen;
    }

    void finish()
    {
        completed = true;
        cancelTimer();
        state = PlaybackState::Finished;
        core::Log::debug("timeline", "playback finished after " + std::to_string(cursor) + " frames");
        if (callbacks.onComplete)
            callbacks.onComplete();
    }

    void tick(core::u64 gen)
    {
        if (gen != generation || state != PlaybackState::Playing)
            return;

        const core::f64 elapsed = std::max(0.0, clock.nowMs() - anchorMs);
        const auto remaining = static_cast<core::f64>(frames.size() - anchorCursor);

        // Clamp before the cast; a degenerate step length yields inf or NaN.
        core::f64 quotient = std::floor(elapsed / timing.msPerStep);
        if (!(quotient < remaining))
            quotient = remaining;
        const core::usize target = anchorCursor + static_cast<core::usize>(quotient);

        while (cursor < target)
        {
            const core::usize index = cursor++;
            if (!emit(index, gen))
                return;
        }

        if (cursor == frames.size() && !completed)
            finish();
    }
};

TimelinePlayer::TimelinePlayer(FrameSequence frames,
                               IClock& clock,
                               PlaybackTiming timing,
                               PlayerCallbacks callbacks)
    : impl_{std::make_shared<Impl>(std::move(frames), clock, timing, std::move(callbacks))}
{
    RWD_ASSERT(timing.msPerStep > 0.0);
    RWD_ASSERT(timing.tickIntervalMs > 0.0);
}

TimelinePlayer::~TimelinePlayer()
{
    if (impl_)
        stop();
}

TimelinePlayer::TimelinePlayer(TimelinePlayer&&) noexcept = default;
TimelinePlayer& TimelinePlayer::operator=(TimelinePlayer&&) noexcept = default;

void TimelinePlayer::start()
{
    auto& impl = *impl_;
    if (impl.state == PlaybackState::Playing || impl.state == PlaybackState::Stopped || impl.completed)
        return;

    impl.cancelTimer();
    const core::u64 gen = impl.generation;
    impl.reanchor();
    impl.state = PlaybackState::Playing;

    std::weak_ptr<Impl> weak = impl_;
    impl.timer = impl.clock.scheduleRepeating(impl.timing.tickIntervalMs, [weak, gen]() {
        // Holding the lock keeps the state alive if a callback destroys the player.
        if (auto self = weak.lock())
            self->tick(gen);
    });
}

void TimelinePlayer::pause()
{
    auto& impl = *impl_;
    if (impl.state != PlaybackState::Playing)
        return;

    impl.cancelTimer();
    impl.state = PlaybackState::Paused;
}

void TimelinePlayer::stepForward()
{
    auto self = impl_;
    if (self->state == PlaybackState::Stopped || self->cursor >= self->frames.size())
        return;

    const core::u64 gen = self->generation;
    const core::usize index = self->cursor++;
    if (!self->emit(index, gen))
        return;

    if (self->state == PlaybackState::Playing)
        self->reanchor();

    if (self->cursor == self->frames.size() && !self->completed)
        self->finish();
}

void TimelinePlayer::stepBackward()
{
    auto self = impl_;
    if (self->state == PlaybackState::Stopped || self->cursor < 2)
        return;

    const core::u64 gen = self->generation;
    --self->cursor;
    if (self->state == PlaybackState::Finished)
        self->state = PlaybackState::Paused;
    if (!self->emit(self->cursor - 1, gen))
        return;

    if (self->state == PlaybackState::Playing)
        self->reanchor();
}

void TimelinePlayer::stop()
{
    auto& impl = *impl_;
    if (impl.state == PlaybackState::Stopped)
        return;

    impl.cancelTimer();
    impl.state = PlaybackState::Stopped;
    impl.frames = FrameSequence{};
    impl.cursor = 0;
}

core::usize TimelinePlayer::cursor() const noexcept
{
    return impl_->cursor;
}

core::usize TimelinePlayer::length() const noexcept
{
    return impl_->frames.size();
}

PlaybackState TimelinePlayer::state() const noexcept
{
    return impl_->state;
}

bool TimelinePlayer::isRunning() const noexcept
{
    return impl_->state == PlaybackState::Playing;
}

bool TimelinePlayer::isFinished() const noexcept
{
    return impl_->completed;
}

} // namespace rwd::timeline
