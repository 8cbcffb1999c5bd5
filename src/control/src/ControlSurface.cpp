// /////////////////////////////////////////////////////////////////////////////
/// @file ControlSurface.cpp
/// @brief ControlSurface implementation.
// /////////////////////////////////////////////////////////////////////////////

#include <rwd/control/ControlSurface.hpp>
#include <rwd/core/Log.hpp>

#include <algorithm>

namespace rwd::control {

ControlSurface::ControlSurface(engine::ExecutionController& controller, std::string originalScript)
    : controller_{controller}, originalScript_{std::move(originalScript)}
{
}

bool ControlSurface::handleKey(const KeyEvent& event, bool editorFocused)
{
    if (!editorFocused)
        return false;

    const auto state = controller_.state();

    if (event.key == Key::Enter && event.hasRunModifier() && state == engine::EditorState::Editing)
    {
        auto ran = controller_.run();
        if (ran && controller_.state() == engine::EditorState::Paused &&
            controller_.config().playOnShortcutRun())
        {
            ran = controller_.play();
        }
        if (!ran)
            core::Log::warn("control", "run shortcut failed: " + ran.error().message());
        return true;
    }

    if (event.key == Key::Escape && state == engine::EditorState::Running)
    {
        controller_.cancel();
        return true;
    }

    return false;
}

core::Expected<void> ControlSurface::dispatch(ControlAction action)
{
    core::Log::debug("control", toString(action));

    switch (action)
    {
    case ControlAction::Run:          return controller_.run();
    case ControlAction::Play:         return controller_.play();
    case ControlAction::Pause:        return controller_.pause();
    case ControlAction::StepForward:  return controller_.stepForward();
    case ControlAction::StepBackward: return controller_.stepBackward();
    case ControlAction::Cancel:
        controller_.cancel();
        return {};
    case ControlAction::ResetCode:    return controller_.resetCode(originalScript_);
    }
    return core::makeError(core::ErrorCode::kInvalidArgument, "unknown control action");
}

std::vector<ControlAction> ControlSurface::availableActions(engine::EditorState state)
{
    switch (state)
    {
    case engine::EditorState::Editing:
        return {ControlAction::Run, ControlAction::ResetCode};
    case engine::EditorState::Paused:
        return {ControlAction::Play, ControlAction::StepForward, ControlAction::StepBackward,
                ControlAction::Cancel};
    case engine::EditorState::Running:
        return {ControlAction::Pause, ControlAction::StepForward, ControlAction::StepBackward,
                ControlAction::Cancel};
    }
    return {};
}

bool ControlSurface::isAvailable(ControlAction action) const
{
    const auto actions = availableActions(controller_.state());
    return std::find(actions.begin(), actions.end(), action) != actions.end();
}

std::string ControlSurface::progressLabel() const
{
    const auto count = controller_.stepCount();
    if (controller_.state() == engine::EditorState::Editing || count == 0)
        return {};
    return "step " + std::to_string(controller_.stepIndex()) + " / " + std::to_string(count - 1);
}

void ControlSurface::setOriginalScript(std::string script)
{
    originalScript_ = std::move(script);
}

} // namespace rwd::control
