// /////////////////////////////////////////////////////////////////////////////
/// @file KeyEvent.hpp
/// @brief Keyboard and button requests fed into the control surface.
// /////////////////////////////////////////////////////////////////////////////
#pragma once

#include <rwd/core/Types.hpp>

#include <string_view>

namespace rwd::control {

/// @brief Keys the control surface reacts to; everything else is Other.
enum class Key : core::u8
{
    Enter,
    Escape,
    Other
};

/// @brief Host-neutral key press.
struct KeyEvent
{
    Key key{Key::Other};
    bool shift{false};
    bool ctrl{false};
    bool meta{false};

    [[nodiscard]] constexpr bool hasRunModifier() const noexcept { return shift || ctrl || meta; }
};

/// @brief Control-bar affordances.
enum class ControlAction : core::u8
{
    Run,
    Play,
    Pause,
    StepForward,
    StepBackward,
    Cancel,
    ResetCode
};

[[nodiscard]] constexpr std::string_view toString(ControlAction action) noexcept
{
    switch (action)
    {
    case ControlAction::Run:          return "run";
    case ControlAction::Play:         return "play";
    case ControlAction::Pause:        return "pause";
    case ControlAction::StepForward:  return "step forward";
    case ControlAction::StepBackward: return "step backward";
    case ControlAction::Cancel:       return "cancel";
    case ControlAction::ResetCode:    return "reset code";
    }
    return "unknown";
}

} // namespace rwd::control
