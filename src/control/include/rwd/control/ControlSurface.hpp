// /////////////////////////////////////////////////////////////////////////////
/// @file ControlSurface.hpp
/// @brief Play/pause/step/reset affordances and keyboard shortcuts.
// /////////////////////////////////////////////////////////////////////////////
#pragma once

#include <rwd/control/KeyEvent.hpp>
#include <rwd/engine/ExecutionController.hpp>
#include <rwd/engine/EditorState.hpp>
#include <rwd/core/Expected.hpp>

#include <string>
#include <vector>

namespace rwd::control {

// /////////////////////////////////////////////////////////////////////////////
/// @class ControlSurface
/// @brief Translates buttons and key presses into controller requests.
///
/// Shortcuts only apply while the editor has focus:
///   Shift/Ctrl/Meta + Enter while editing: run, then play when configured.
///   Escape while running: cancel.
// /////////////////////////////////////////////////////////////////////////////
class ControlSurface
{
public:
    /// @param controller     Controller to drive; must outlive the surface.
    /// @param originalScript Text restored by ControlAction::ResetCode.
    ControlSurface(engine::ExecutionController& controller, std::string originalScript);

    /// @brief Route a key press.
    /// @return true when the key was consumed (host suppresses default handling).
    bool handleKey(const KeyEvent& event, bool editorFocused);

    /// @brief Route a button press.
    [[nodiscard]] core::Expected<void> dispatch(ControlAction action);

    /// @brief Buttons enabled in @p state.
    [[nodiscard]] static std::vector<ControlAction> availableActions(engine::EditorState state);

    [[nodiscard]] bool isAvailable(ControlAction action) const;

    /// @brief "step i / n" while a replay is staged, empty while editing.
    [[nodiscard]] std::string progressLabel() const;

    void setOriginalScript(std::string script);

private:
    engine::ExecutionController& controller_;
    std::string originalScript_;
};

} // namespace rwd::control
