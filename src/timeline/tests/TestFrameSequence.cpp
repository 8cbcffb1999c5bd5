/**
 * @file TestFrameSequence.cpp
 * @brief Unit tests for timeline::FrameSequence and Frame.
 */

#include <catch2/catch_test_macros.hpp>

#include "rwd/timeline/FrameSequence.hpp"

namespace rwd::timeline {

namespace {

struct Cell
{
    core::i32 x;
    core::i32 y;
};

} // anonymous namespace

TEST_CASE("FrameSequence empty sequence is valid", "[timeline][frames]")
{
    FrameSequence seq;

    REQUIRE(seq.empty());
    REQUIRE(seq.size() == 0);
    REQUIRE(seq.lastFrame() == nullptr);
    REQUIRE_FALSE(seq.at(0).has_value());
}

TEST_CASE("FrameSequence at() is bounds checked", "[timeline][frames]")
{
    FrameSequence seq{std::vector<Frame>{Frame::of(Cell{1, 2}), Frame::of(Cell{3, 4}, 7u)}};

    REQUIRE(seq.size() == 2);

    auto first = seq.at(0);
    REQUIRE(first.has_value());
    REQUIRE(first->get().as<Cell>()->x == 1);
    REQUIRE_FALSE(first->get().sourceLine().has_value());

    auto missing = seq.at(2);
    REQUIRE_FALSE(missing.has_value());
    REQUIRE(missing.error().code() == core::ErrorCode::kOutOfRange);

    REQUIRE(seq.lastFrame()->sourceLine() == 7u);
}

TEST_CASE("Frame refuses to decode a payload of the wrong size", "[timeline][frames]")
{
    const auto frame = Frame::of(Cell{5, 6});

    REQUIRE(frame.state().size() == sizeof(Cell));
    REQUIRE(frame.as<Cell>()->y == 6);
    REQUIRE_FALSE(frame.as<core::u8>().has_value());
}

} // namespace rwd::timeline
