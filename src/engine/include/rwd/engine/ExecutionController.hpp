// /////////////////////////////////////////////////////////////////////////////
/// @file ExecutionController.hpp
/// @brief editing / running / paused coordinator (Façade + State patterns).
///
/// Single entry-point the control surface talks to. Runs the interpreter,
/// owns the active TimelinePlayer, keeps the editor's highlight, diagnostic
/// and read-only flag in sync, and reports to the host.
// /////////////////////////////////////////////////////////////////////////////
#pragma once

#include <rwd/engine/Config.hpp>
#include <rwd/engine/EditorState.hpp>
#include <rwd/engine/IEditorView.hpp>
#include <rwd/engine/IInterpreter.hpp>
#include <rwd/engine/IReplayHost.hpp>
#include <rwd/timeline/IClock.hpp>
#include <rwd/diagnostics/TextRange.hpp>
#include <rwd/core/Types.hpp>
#include <rwd/core/Expected.hpp>
#include <rwd/core/NonCopyable.hpp>

#include <memory>
#include <optional>
#include <string>

namespace rwd::engine {

/// @brief Replay state machine.
///
/// Transitions:
///   editing --run-->   paused   (interpreter succeeded)
///   editing --run-->   editing  (script error, diagnostic or host report)
///   paused  --play-->  running
///   running --pause--> paused
///   running|paused --step--> same state
///   any     --cancel--> editing
///   running|paused --completion--> editing
///
/// Requests that the current state does not accept are InternalStateViolations:
/// nothing changes and kInvalidState is returned.
class ExecutionController final : public core::NonCopyable<ExecutionController>
{
public:
    /// @param config      Immutable configuration.
    /// @param interpreter Script interpreter; reset before every run.
    /// @param view        Host editor adapter.
    /// @param host        Host UI listener.
    /// @param clock       Clock driving continuous playback.
    /// @param persistence Optional script storage.
    ExecutionController(Config config,
                        IInterpreter& interpreter,
                        IEditorView& view,
                        IReplayHost& host,
                        timeline::IClock& clock,
                        IPersistence* persistence = nullptr);
    ~ExecutionController();

    /// @brief Run the editor's current script and stage the replay paused.
    [[nodiscard]] core::Expected<void> run();

    /// @brief paused -> running.
    [[nodiscard]] core::Expected<void> play();

    /// @brief running -> paused.
    [[nodiscard]] core::Expected<void> pause();

    /// @brief Emit the next frame (running or paused).
    [[nodiscard]] core::Expected<void> stepForward();

    /// @brief Re-emit the previous frame (running or paused).
    [[nodiscard]] core::Expected<void> stepBackward();

    /// @brief Abort any replay, back to editing; the host gets the script text.
    void cancel();

    /// @brief Tear everything down without notifying the host.
    void reset();

    /// @brief Replace the editor text with @p originalScript (editing only).
    [[nodiscard]] core::Expected<void> resetCode(std::string originalScript);

    [[nodiscard]] EditorState state() const noexcept;

    /// @brief Index of the frame on display (0 before the first frame).
    [[nodiscard]] core::usize stepIndex() const noexcept;

    /// @brief Frames in the staged replay (0 while editing).
    [[nodiscard]] core::usize stepCount() const noexcept;

    /// @brief Inline diagnostic from the last failed run, if any.
    [[nodiscard]] const std::optional<diagnostics::TextRange>& diagnostic() const noexcept;

    [[nodiscard]] const Config& config() const noexcept;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace rwd::engine
