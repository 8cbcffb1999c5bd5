// /////////////////////////////////////////////////////////////////////////////
/// @file EditorState.hpp
/// @brief Controller state shared by every control affordance.
// /////////////////////////////////////////////////////////////////////////////
#pragma once

#include <rwd/core/Types.hpp>

#include <string_view>

namespace rwd::engine {

enum class EditorState : core::u8
{
    Editing,
    Running,
    Paused
};

[[nodiscard]] constexpr std::string_view toString(EditorState state) noexcept
{
    switch (state)
    {
    case EditorState::Editing: return "editing";
    case EditorState::Running: return "running";
    case EditorState::Paused:  return "paused";
    }
    return "unknown";
}

} // namespace rwd::engine
