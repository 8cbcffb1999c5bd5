// /////////////////////////////////////////////////////////////////////////////
/// @file Frame.hpp
/// @brief One immutable world-state snapshot produced by a script run.
///
/// The payload is opaque to the replay engine: the interpreter writes it and
/// the host decodes it. The optional source line (1-based) is the script
/// line that produced the frame and drives editor line highlighting.
// /////////////////////////////////////////////////////////////////////////////
#pragma once

#include <rwd/core/Types.hpp>

#include <cstring>
#include <optional>
#include <span>
#include <type_traits>
#include <vector>

namespace rwd::timeline {

/// @brief Trivially copyable state that can be stored in a Frame verbatim.
template <typename T>
concept BlittableState = std::is_trivially_copyable_v<T> && std::is_standard_layout_v<T>
                         && std::is_default_constructible_v<T>;

class Frame
{
public:
    Frame() = default;

    /// @param state      Serialised world state.
    /// @param sourceLine Script line that produced this state, if known.
    explicit Frame(std::vector<core::byte> state,
                   std::optional<core::u32> sourceLine = std::nullopt)
        : state_{std::move(state)}, sourceLine_{sourceLine}
    {
    }

    /// @brief Build a frame holding a byte copy of @p value.
    template <BlittableState T>
    [[nodiscard]] static Frame of(const T& value,
                                  std::optional<core::u32> sourceLine = std::nullopt)
    {
        std::vector<core::byte> bytes(sizeof(T));
        std::memcpy(bytes.data(), &value, sizeof(T));
        return Frame{std::move(bytes), sourceLine};
    }

    /// @brief Decode the payload as @p T; nullopt when the size does not match.
    template <BlittableState T>
    [[nodiscard]] std::optional<T> as() const
    {
        if (state_.size() != sizeof(T))
            return std::nullopt;
        T value;
        std::memcpy(&value, state_.data(), sizeof(T));
        return value;
    }

    [[nodiscard]] std::span<const core::byte> state() const noexcept { return state_; }
    [[nodiscard]] std::optional<core::u32> sourceLine() const noexcept { return sourceLine_; }

private:
    std::vector<core::byte> state_;
    std::optional<core::u32> sourceLine_;
};

} // namespace rwd::timeline
