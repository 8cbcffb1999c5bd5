// /////////////////////////////////////////////////////////////////////////////
/// @file FrameSequence.hpp
/// @brief Ordered, finite list of frames returned whole by one interpreter run.
// /////////////////////////////////////////////////////////////////////////////
#pragma once

#include <rwd/timeline/Frame.hpp>
#include <rwd/core/Types.hpp>
#include <rwd/core/Expected.hpp>

#include <functional>
#include <vector>

namespace rwd::timeline {

/// @brief Immutable frame container with bounds-checked read access.
///
/// An empty sequence is legal: a run that produced no steps plays back as
/// "finished" straight away.
class FrameSequence
{
public:
    using const_iterator = std::vector<Frame>::const_iterator;

    FrameSequence();
    explicit FrameSequence(std::vector<Frame> frames);
    ~FrameSequence();

    FrameSequence(FrameSequence&&) noexcept;
    FrameSequence& operator=(FrameSequence&&) noexcept;
    FrameSequence(const FrameSequence&);
    FrameSequence& operator=(const FrameSequence&);

    [[nodiscard]] core::usize size() const noexcept;
    [[nodiscard]] bool empty() const noexcept;

    /// @brief Checked access.
    /// @return The frame, or kOutOfRange when @p index >= size().
    [[nodiscard]] core::Expected<std::reference_wrapper<const Frame>> at(core::usize index) const;

    /// @brief Unchecked access (asserts in debug builds).
    [[nodiscard]] const Frame& operator[](core::usize index) const;

    /// @brief Last frame, or nullptr for an empty sequence.
    [[nodiscard]] const Frame* lastFrame() const noexcept;

    [[nodiscard]] const_iterator begin() const noexcept { return frames_.begin(); }
    [[nodiscard]] const_iterator end() const noexcept { return frames_.end(); }

private:
    std::vector<Frame> frames_;
};

} // namespace rwd::timeline
