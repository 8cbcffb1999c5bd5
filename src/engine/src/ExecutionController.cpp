// /////////////////////////////////////////////////////////////////////////////
/// @file ExecutionController.cpp
/// @brief ExecutionController implementation.
// /////////////////////////////////////////////////////////////////////////////

#include <rwd/engine/ExecutionController.hpp>
#include <rwd/timeline/TimelinePlayer.hpp>
#include <rwd/diagnostics/PositionResolver.hpp>
#include <rwd/diagnostics/ScriptStats.hpp>
#include <rwd/core/Assert.hpp>
#include <rwd/core/Log.hpp>

#include <string_view>

namespace rwd::engine {

namespace {

core::Unexpected rejected(std::string_view request, EditorState state)
{
    std::string message{request};
    message += " rejected while ";
    message += toString(state);
    core::Log::debug("engine", message);
    return core::makeError(core::ErrorCode::kInvalidState, std::move(message));
}

} // anonymous namespace

struct ExecutionController::Impl
{
    Config config;
    IInterpreter& interpreter;
    IEditorView& view;
    IReplayHost& host;
    timeline::IClock& clock;
    IPersistence* persistence;

    EditorState state{EditorState::Editing};
    std::unique_ptr<timeline::TimelinePlayer> player;

    // Script and results of the staged replay.
    std::string script;
    std::optional<timeline::Frame> finalFrame;
    core::usize stepIndex{0};
    core::usize stepCount{0};
    std::optional<diagnostics::TextRange> diagnostic;

    Impl(Config cfg, IInterpreter& interp, IEditorView& v, IReplayHost& h,
         timeline::IClock& clk, IPersistence* store)
        : config{std::move(cfg)}
        , interpreter{interp}
        , view{v}
        , host{h}
        , clock{clk}
        , persistence{store}
    {
    }

    void persist(std::string_view text)
    {
        if (persistence)
            persistence->saveScript(config.contextId(), text);
    }

    void setState(EditorState next)
    {
        if (next == state)
            return;
        core::Log::debug("engine", std::string{toString(state)} + " -> " + std::string{toString(next)});
        state = next;
        view.setEditable(state == EditorState::Editing);
    }

    void retirePlayer()
    {
        if (player)
        {
            player->stop();
            player.reset();
        }
    }

    void resetState()
    {
        retirePlayer();
        setState(EditorState::Editing);
        view.setHighlight(std::nullopt);
        view.setDiagnostic(std::nullopt);
        diagnostic.reset();
        finalFrame.reset();
        stepIndex = 0;
        stepCount = 0;
    }

    void onFrame(core::usize index, const timeline::Frame& frame)
    {
        stepIndex = index;
        if (const auto line = frame.sourceLine())
            view.setHighlight(*line);
        host.onFrame(index, frame);
    }

    void onComplete()
    {
        const std::string finished = std::move(script);
        const std::optional<timeline::Frame> last = std::move(finalFrame);
        const ReplayStats stats{stepCount, diagnostics::codeLength(finished)};

        resetState();
        core::Log::info("engine", "replay finished after " + std::to_string(stats.stepCount) + " steps");
        persist(finished);
        host.onReplayDone(finished, last ? &*last : nullptr, stats);
    }

    void reportError(const diagnostics::ScriptError& error, const std::string& text)
    {
        if (const auto* positioned = error.positioned())
        {
            auto range = diagnostics::resolveOrFallback(*positioned, view);
            core::Log::info("engine", "script error at line " + std::to_string(positioned->line) +
                                      ": " + positioned->message);
            view.setDiagnostic(range);
            diagnostic = std::move(range);
            return;
        }

        core::Log::warn("engine", "script failed: " + error.message());
        host.onScriptError(text, error.message());
    }
};

ExecutionController::ExecutionController(Config config,
                                         IInterpreter& interpreter,
                                         IEditorView& view,
                                         IReplayHost& host,
                                         timeline::IClock& clock,
                                         IPersistence* persistence)
    : impl_{std::make_unique<Impl>(std::move(config), interpreter, view, host, clock, persistence)}
{
}

ExecutionController::~ExecutionController()
{
    if (impl_)
        impl_->retirePlayer();
}

core::Expected<void> ExecutionController::run()
{
    auto& impl = *impl_;
    if (impl.state != EditorState::Editing)
        return rejected("run", impl.state);

    impl.resetState();

    std::string text = impl.view.text();
    impl.persist(text);

    impl.interpreter.reset();
    auto result = impl.interpreter.run(text, impl.config.contextId());
    if (!result)
    {
        impl.reportError(result.error(), text);
        return {};
    }

    timeline::FrameSequence frames = std::move(*result);
    impl.stepCount = frames.size();
    if (const auto* last = frames.lastFrame())
        impl.finalFrame = *last;
    impl.script = std::move(text);

    const timeline::PlaybackTiming timing{impl.config.msPerStep(), impl.config.tickIntervalMs()};
    timeline::PlayerCallbacks callbacks;
    callbacks.onFrame = [&impl](core::usize index, const timeline::Frame& frame) {
        impl.onFrame(index, frame);
    };
    callbacks.onComplete = [&impl]() { impl.onComplete(); };

    impl.player = std::make_unique<timeline::TimelinePlayer>(std::move(frames), impl.clock, timing,
                                                             std::move(callbacks));

    core::Log::info("engine", "staged replay of " + std::to_string(impl.stepCount) + " steps");
    impl.setState(EditorState::Paused);
    return {};
}

core::Expected<void> ExecutionController::play()
{
    auto& impl = *impl_;
    if (impl.state != EditorState::Paused)
        return rejected("play", impl.state);

    RWD_ASSERT(impl.player);
    impl.setState(EditorState::Running);
    impl.player->start();
    return {};
}

core::Expected<void> ExecutionController::pause()
{
    auto& impl = *impl_;
    if (impl.state != EditorState::Running)
        return rejected("pause", impl.state);

    RWD_ASSERT(impl.player);
    impl.player->pause();
    impl.setState(EditorState::Paused);
    return {};
}

core::Expected<void> ExecutionController::stepForward()
{
    auto& impl = *impl_;
    if (impl.state == EditorState::Editing)
        return rejected("step forward", impl.state);

    RWD_ASSERT(impl.player);
    impl.player->stepForward();
    return {};
}

core::Expected<void> ExecutionController::stepBackward()
{
    auto& impl = *impl_;
    if (impl.state == EditorState::Editing)
        return rejected("step backward", impl.state);

    RWD_ASSERT(impl.player);
    impl.player->stepBackward();
    return {};
}

void ExecutionController::cancel()
{
    auto& impl = *impl_;
    impl.resetState();
    impl.script.clear();

    const std::string text = impl.view.text();
    core::Log::info("engine", "replay cancelled");
    impl.persist(text);
    impl.host.onCancel(text);
}

void ExecutionController::reset()
{
    impl_->resetState();
    impl_->script.clear();
}

core::Expected<void> ExecutionController::resetCode(std::string originalScript)
{
    auto& impl = *impl_;
    if (impl.state != EditorState::Editing)
        return rejected("reset code", impl.state);

    impl.view.setDiagnostic(std::nullopt);
    impl.diagnostic.reset();
    impl.view.replaceText(std::move(originalScript));
    return {};
}

EditorState ExecutionController::state() const noexcept
{
    return impl_->state;
}

core::usize ExecutionController::stepIndex() const noexcept
{
    return impl_->stepIndex;
}

core::usize ExecutionController::stepCount() const noexcept
{
    return impl_->stepCount;
}

const std::optional<diagnostics::TextRange>& ExecutionController::diagnostic() const noexcept
{
    return impl_->diagnostic;
}

const Config& ExecutionController::config() const noexcept
{
    return impl_->config;
}

} // namespace rwd::engine
