// /////////////////////////////////////////////////////////////////////////////
/// @file FrameSequence.cpp
/// @brief FrameSequence implementation.
// /////////////////////////////////////////////////////////////////////////////

#include <rwd/timeline/FrameSequence.hpp>
#include <rwd/core/Assert.hpp>

#include <string>

namespace rwd::timeline {

FrameSequence::FrameSequence() = default;
FrameSequence::FrameSequence(std::vector<Frame> frames) : frames_{std::move(frames)} {}
FrameSequence::~FrameSequence() = default;

FrameSequence::FrameSequence(FrameSequence&&) noexcept = default;
FrameSequence& FrameSequence::operator=(FrameSequence&&) noexcept = default;
FrameSequence::FrameSequence(const FrameSequence&) = default;
FrameSequence& FrameSequence::operator=(const FrameSequence&) = default;

core::usize FrameSequence::size() const noexcept
{
    return frames_.size();
}

bool FrameSequence::empty() const noexcept
{
    return frames_.empty();
}

core::Expected<std::reference_wrapper<const Frame>> FrameSequence::at(core::usize index) const
{
    if (index >= frames_.size())
    {
        return core::makeError(core::ErrorCode::kOutOfRange,
                               "frame index " + std::to_string(index) +
                               " past sequence of " + std::to_string(frames_.size()));
    }
    return std::cref(frames_[index]);
}

const Frame& FrameSequence::operator[](core::usize index) const
{
    RWD_ASSERT(index < frames_.size());
    return frames_[index];
}

const Frame* FrameSequence::lastFrame() const noexcept
{
    return frames_.empty() ? nullptr : &frames_.back();
}

} // namespace rwd::timeline
