/**
 * @file TestTimelinePlayer.cpp
 * @brief Unit tests for timeline::TimelinePlayer.
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/generators/catch_generators.hpp>

#include "rwd/timeline/ManualClock.hpp"
#include "rwd/timeline/TimelinePlayer.hpp"

#include <functional>
#include <memory>
#include <vector>

namespace rwd::timeline {

namespace {

FrameSequence makeFrames(core::usize count)
{
    std::vector<Frame> frames;
    for (core::usize i = 0; i < count; ++i)
        frames.push_back(Frame::of(static_cast<core::i32>(i), static_cast<core::u32>(i + 1)));
    return FrameSequence{std::move(frames)};
}

struct Recorder
{
    std::vector<core::usize> indices;
    int completions{0};

    PlayerCallbacks callbacks()
    {
        PlayerCallbacks cb;
        cb.onFrame = [this](core::usize index, const Frame&) { indices.push_back(index); };
        cb.onComplete = [this]() { ++completions; };
        return cb;
    }
};

/// Clock whose cancel() forgets nothing, so tests can deliver stale ticks.
class LeakyClock final : public IClock
{
public:
    core::f64 now{0.0};
    std::vector<std::function<void()>> scheduled;

    core::f64 nowMs() const noexcept override { return now; }

    TimerHandle scheduleRepeating(core::f64, std::function<void()> callback) override
    {
        scheduled.push_back(std::move(callback));
        return scheduled.size();
    }

    void cancel(TimerHandle) noexcept override {}
};

constexpr PlaybackTiming kTiming{100.0, 10.0};

std::vector<core::usize> iota(core::usize from, core::usize to)
{
    std::vector<core::usize> out;
    for (core::usize i = from; i < to; ++i)
        out.push_back(i);
    return out;
}

} // anonymous namespace

TEST_CASE("TimelinePlayer plays every frame in order then completes once", "[timeline][player]")
{
    const core::usize count = GENERATE(0u, 1u, 2u, 5u, 17u);

    ManualClock clock;
    Recorder rec;
    TimelinePlayer player{makeFrames(count), clock, kTiming, rec.callbacks()};

    player.start();
    for (core::usize t = 0; t < (count + 3) * 10; ++t)
        clock.advance(10.0);

    REQUIRE(rec.indices == iota(0, count));
    REQUIRE(rec.completions == 1);
    REQUIRE(player.isFinished());
    REQUIRE(player.cursor() == count);
    REQUIRE(clock.activeTimers() == 0);
}

TEST_CASE("TimelinePlayer emits every intermediate frame when ticks coalesce", "[timeline][player]")
{
    ManualClock clock;
    Recorder rec;
    TimelinePlayer player{makeFrames(5), clock, kTiming, rec.callbacks()};

    player.start();
    clock.advance(320.0);
    REQUIRE(rec.indices == iota(0, 3));
    REQUIRE(rec.completions == 0);

    clock.advance(1000.0);
    REQUIRE(rec.indices == iota(0, 5));
    REQUIRE(rec.completions == 1);
}

TEST_CASE("TimelinePlayer fires nothing when the target equals the cursor", "[timeline][player]")
{
    ManualClock clock;
    Recorder rec;
    TimelinePlayer player{makeFrames(3), clock, kTiming, rec.callbacks()};

    player.start();
    for (int i = 0; i < 9; ++i)
        clock.advance(10.0);

    REQUIRE(rec.indices.empty());
    REQUIRE(player.isRunning());
}

TEST_CASE("TimelinePlayer step at the boundaries is a silent no-op", "[timeline][player]")
{
    ManualClock clock;
    Recorder rec;
    TimelinePlayer player{makeFrames(2), clock, kTiming, rec.callbacks()};

    player.stepBackward();
    REQUIRE(rec.indices.empty());
    REQUIRE(player.cursor() == 0);

    player.stepForward();
    player.stepForward();
    REQUIRE(rec.indices == iota(0, 2));
    REQUIRE(rec.completions == 1);

    player.stepForward();
    REQUIRE(rec.indices.size() == 2);
    REQUIRE(rec.completions == 1);
    REQUIRE(player.cursor() == 2);
}

TEST_CASE("TimelinePlayer stepBackward re-emits the previous frame", "[timeline][player]")
{
    ManualClock clock;
    Recorder rec;
    TimelinePlayer player{makeFrames(4), clock, kTiming, rec.callbacks()};

    player.stepForward();
    player.stepForward();
    player.stepForward();
    REQUIRE(player.cursor() == 3);

    player.stepBackward();
    REQUIRE(player.cursor() == 2);
    REQUIRE(rec.indices.back() == 1);

    player.stepBackward();
    REQUIRE(player.cursor() == 1);
    REQUIRE(rec.indices.back() == 0);

    player.stepBackward();
    REQUIRE(player.cursor() == 1);
    REQUIRE(rec.indices.size() == 5);
}

TEST_CASE("TimelinePlayer resumes from the stepped-to index after pause", "[timeline][player]")
{
    ManualClock clock;
    Recorder rec;
    TimelinePlayer player{makeFrames(5), clock, kTiming, rec.callbacks()};

    player.start();
    for (int i = 0; i < 15; ++i)
        clock.advance(10.0);
    REQUIRE(rec.indices == iota(0, 1));

    player.pause();
    REQUIRE_FALSE(player.isRunning());
    clock.advance(500.0);
    REQUIRE(rec.indices.size() == 1);

    player.stepForward();
    REQUIRE(rec.indices == iota(0, 2));

    player.start();
    for (int i = 0; i < 10; ++i)
        clock.advance(10.0);
    REQUIRE(rec.indices == iota(0, 3));
}

TEST_CASE("TimelinePlayer stepForward while playing restarts the step interval", "[timeline][player]")
{
    ManualClock clock;
    Recorder rec;
    TimelinePlayer player{makeFrames(5), clock, kTiming, rec.callbacks()};

    player.start();
    for (int i = 0; i < 15; ++i)
        clock.advance(10.0);
    REQUIRE(rec.indices == iota(0, 1));

    player.stepForward();
    REQUIRE(rec.indices == iota(0, 2));
    REQUIRE(player.isRunning());

    for (int i = 0; i < 9; ++i)
        clock.advance(10.0);
    REQUIRE(rec.indices == iota(0, 2));

    clock.advance(10.0);
    REQUIRE(rec.indices == iota(0, 3));
}

TEST_CASE("TimelinePlayer stepBackward while playing resumes from the earlier frame", "[timeline][player]")
{
    ManualClock clock;
    Recorder rec;
    TimelinePlayer player{makeFrames(5), clock, kTiming, rec.callbacks()};

    player.start();
    for (int i = 0; i < 25; ++i)
        clock.advance(10.0);
    REQUIRE(rec.indices == iota(0, 2));

    player.stepBackward();
    REQUIRE(rec.indices == std::vector<core::usize>{0, 1, 0});
    REQUIRE(player.cursor() == 1);
    REQUIRE(player.isRunning());

    for (int i = 0; i < 9; ++i)
        clock.advance(10.0);
    REQUIRE(rec.indices == std::vector<core::usize>{0, 1, 0});

    clock.advance(10.0);
    REQUIRE(rec.indices == std::vector<core::usize>{0, 1, 0, 1});
}

TEST_CASE("TimelinePlayer stepping back from the end never completes twice", "[timeline][player]")
{
    ManualClock clock;
    Recorder rec;
    TimelinePlayer player{makeFrames(3), clock, kTiming, rec.callbacks()};

    player.stepForward();
    player.stepForward();
    player.stepForward();
    REQUIRE(rec.completions == 1);
    REQUIRE(player.state() == PlaybackState::Finished);

    player.stepBackward();
    REQUIRE(player.state() == PlaybackState::Paused);
    REQUIRE(player.cursor() == 2);
    REQUIRE(rec.indices.back() == 1);

    player.stepForward();
    REQUIRE(rec.indices.back() == 2);
    REQUIRE(player.cursor() == 3);
    REQUIRE(rec.completions == 1);

    player.start();
    clock.advance(1'000.0);
    REQUIRE(rec.indices.size() == 5);
    REQUIRE(rec.completions == 1);
}

TEST_CASE("TimelinePlayer plays out a vanishing step length without overflow", "[timeline][player]")
{
    ManualClock clock;
    Recorder rec;
    TimelinePlayer player{makeFrames(5), clock, PlaybackTiming{1e-297, 16.0}, rec.callbacks()};

    player.start();
    clock.advance(16.0);

    REQUIRE(rec.indices == iota(0, 5));
    REQUIRE(rec.completions == 1);
    REQUIRE(clock.activeTimers() == 0);
}

TEST_CASE("TimelinePlayer start is a no-op while playing", "[timeline][player]")
{
    ManualClock clock;
    Recorder rec;
    TimelinePlayer player{makeFrames(3), clock, kTiming, rec.callbacks()};

    player.start();
    clock.advance(50.0);
    player.start();

    REQUIRE(clock.activeTimers() == 1);
    clock.advance(60.0);
    REQUIRE(rec.indices == iota(0, 1));
}

TEST_CASE("TimelinePlayer ignores ticks delivered after stop", "[timeline][player]")
{
    LeakyClock clock;
    Recorder rec;
    TimelinePlayer player{makeFrames(5), clock, kTiming, rec.callbacks()};

    player.start();
    REQUIRE(clock.scheduled.size() == 1);

    player.stop();
    clock.now = 10'000.0;
    clock.scheduled.front()();

    REQUIRE(rec.indices.empty());
    REQUIRE(rec.completions == 0);
    REQUIRE(player.state() == PlaybackState::Stopped);
    REQUIRE(player.length() == 0);

    player.stepForward();
    player.start();
    REQUIRE(rec.indices.empty());
}

TEST_CASE("TimelinePlayer ignores stale ticks from an earlier start", "[timeline][player]")
{
    LeakyClock clock;
    Recorder rec;
    TimelinePlayer player{makeFrames(5), clock, kTiming, rec.callbacks()};

    player.start();
    player.pause();
    player.start();
    REQUIRE(clock.scheduled.size() == 2);

    clock.now = 250.0;
    clock.scheduled.front()();
    REQUIRE(rec.indices.empty());

    clock.scheduled.back()();
    REQUIRE(rec.indices == iota(0, 2));
}

TEST_CASE("TimelinePlayer ignores ticks after destruction", "[timeline][player]")
{
    LeakyClock clock;
    Recorder rec;
    {
        TimelinePlayer player{makeFrames(3), clock, kTiming, rec.callbacks()};
        player.start();
    }

    clock.now = 1'000.0;
    clock.scheduled.front()();
    REQUIRE(rec.indices.empty());
    REQUIRE(rec.completions == 0);
}

TEST_CASE("TimelinePlayer survives being destroyed by its completion callback", "[timeline][player]")
{
    ManualClock clock;
    std::vector<core::usize> indices;
    std::unique_ptr<TimelinePlayer> player;

    PlayerCallbacks cb;
    cb.onFrame = [&](core::usize index, const Frame&) { indices.push_back(index); };
    cb.onComplete = [&]() { player.reset(); };

    player = std::make_unique<TimelinePlayer>(makeFrames(2), clock, kTiming, std::move(cb));
    player->start();
    clock.advance(1'000.0);

    REQUIRE(player == nullptr);
    REQUIRE(indices == iota(0, 2));
    REQUIRE(clock.activeTimers() == 0);
}

TEST_CASE("TimelinePlayer stops emitting when paused from a frame callback", "[timeline][player]")
{
    ManualClock clock;
    std::vector<core::usize> indices;
    int completions = 0;
    TimelinePlayer* self = nullptr;

    PlayerCallbacks cb;
    cb.onFrame = [&](core::usize index, const Frame&) {
        indices.push_back(index);
        if (index == 1)
            self->pause();
    };
    cb.onComplete = [&]() { ++completions; };

    TimelinePlayer player{makeFrames(5), clock, kTiming, std::move(cb)};
    self = &player;

    player.start();
    clock.advance(1'000.0);

    REQUIRE(indices == iota(0, 2));
    REQUIRE(completions == 0);
    REQUIRE(player.state() == PlaybackState::Paused);
    REQUIRE(player.cursor() == 2);
}

TEST_CASE("TimelinePlayer hands out the frame at each index", "[timeline][player]")
{
    ManualClock clock;
    std::vector<core::i32> values;
    std::vector<core::u32> lines;

    PlayerCallbacks cb;
    cb.onFrame = [&](core::usize, const Frame& frame) {
        values.push_back(frame.as<core::i32>().value_or(-1));
        lines.push_back(frame.sourceLine().value_or(0));
    };

    TimelinePlayer player{makeFrames(3), clock, kTiming, std::move(cb)};
    player.stepForward();
    player.stepForward();
    player.stepForward();

    REQUIRE(values == std::vector<core::i32>{0, 1, 2});
    REQUIRE(lines == std::vector<core::u32>{1, 2, 3});
}

} // namespace rwd::timeline
