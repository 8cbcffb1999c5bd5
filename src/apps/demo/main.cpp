// /////////////////////////////////////////////////////////////////////////////
/// @file main.cpp
/// @brief Rewind terminal demo entry-point.
///
/// Runs a grid-world script, then replays it on stdout at the configured
/// pace with the active script line shown under the board.
///
///   rewind_demo <script> [steps-per-second] [goal-x goal-y]
// /////////////////////////////////////////////////////////////////////////////

#include "GridInterpreter.hpp"

#include <rwd/control/ControlSurface.hpp>
#include <rwd/diagnostics/TextDocument.hpp>
#include <rwd/engine/Config.hpp>
#include <rwd/engine/ExecutionController.hpp>
#include <rwd/engine/LoopClock.hpp>
#include <rwd/core/Log.hpp>
#include <rwd/core/Types.hpp>

#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <string>

namespace {

using namespace rwd;

class TerminalEditor final : public engine::IEditorView
{
public:
    explicit TerminalEditor(std::string text) : doc_{std::move(text)} {}

    core::usize lineCount() const noexcept override { return doc_.lineCount(); }
    core::Expected<diagnostics::LineSpan> lineSpanAt(core::u32 line) const override { return doc_.lineSpanAt(line); }
    std::optional<diagnostics::OffsetRange> wordRangeAt(core::usize offset) const override { return doc_.wordRangeAt(offset); }
    core::usize documentLength() const noexcept override { return doc_.documentLength(); }

    std::string text() const override { return doc_.text(); }
    void replaceText(std::string text) override { doc_.setText(std::move(text)); }

    void setHighlight(std::optional<core::u32> line) override
    {
        if (!line)
            return;
        if (auto span = doc_.lineSpanAt(*line))
        {
            const auto code = doc_.slice({span->start, span->end()});
            std::printf("  > %3u | %.*s\n", *line, static_cast<int>(code.size()), code.data());
        }
    }

    void setDiagnostic(std::optional<diagnostics::TextRange> range) override
    {
        if (!range)
            return;

        // Find the line holding range->from to draw a caret underline.
        for (core::u32 line = 1; line <= doc_.lineCount(); ++line)
        {
            const auto span = doc_.lineSpanAt(line);
            if (!span || range->from > span->end())
                continue;

            const auto code = doc_.slice({span->start, span->end()});
            std::printf("%3u | %.*s\n", line, static_cast<int>(code.size()), code.data());
            std::printf("    | %s^%s\n",
                        std::string(range->from - span->start, ' ').c_str(),
                        std::string(range->width() > 1 ? range->width() - 1 : 0, '~').c_str());
            const auto severity = diagnostics::toString(range->severity);
            std::printf("%.*s: %s\n", static_cast<int>(severity.size()), severity.data(),
                        range->message.c_str());
            return;
        }
    }

    void setEditable(bool /*editable*/) override {}

private:
    diagnostics::TextDocument doc_;
};

class TerminalHost final : public engine::IReplayHost
{
public:
    TerminalHost(core::i32 goalX, core::i32 goalY) : goalX_{goalX}, goalY_{goalY} {}

    void onFrame(core::usize index, const timeline::Frame& frame) override
    {
        const auto state = frame.as<demo::GridState>();
        if (!state)
        {
            core::Log::warn("demo", "frame " + std::to_string(index) + " has an unexpected payload");
            return;
        }

        std::printf("\nstep %zu  fuel %d\n", index, state->fuel);
        for (core::i32 y = 0; y < demo::kBoardHeight; ++y)
        {
            for (core::i32 x = 0; x < demo::kBoardWidth; ++x)
            {
                char cell = '.';
                if (x == goalX_ && y == goalY_)
                    cell = 'G';
                if (x == state->x && y == state->y)
                    cell = 'R';
                std::putchar(cell);
            }
            std::putchar('\n');
        }
        std::fflush(stdout);
    }

    void onReplayDone(std::string_view /*script*/, const timeline::Frame* finalFrame,
                      const engine::ReplayStats& stats) override
    {
        const auto state = finalFrame ? finalFrame->as<demo::GridState>() : std::nullopt;
        succeeded_ = state && state->x == goalX_ && state->y == goalY_;
        std::printf("\n%s after %zu steps (code length %zu)\n",
                    succeeded_ ? "objective complete" : "objective not reached",
                    stats.stepCount, stats.codeLength);
    }

    void onScriptError(std::string_view /*script*/, std::string_view message) override
    {
        std::printf("error: %.*s\n", static_cast<int>(message.size()), message.data());
    }

    [[nodiscard]] bool succeeded() const noexcept { return succeeded_; }

private:
    core::i32 goalX_;
    core::i32 goalY_;
    bool succeeded_{false};
};

class AutosaveFile final : public engine::IPersistence
{
public:
    void saveScript(std::string_view contextId, std::string_view script) override
    {
        const std::string path = std::string{contextId} + ".autosave";
        std::ofstream out{path, std::ios::binary | std::ios::trunc};
        out.write(script.data(), static_cast<std::streamsize>(script.size()));
        if (!out)
            core::Log::warn("demo", "could not write " + path);
    }
};

core::Expected<std::string> readScript(const char* path)
{
    std::ifstream in{path, std::ios::binary};
    if (!in)
        return core::makeError(core::ErrorCode::kIoError, std::string{"cannot open "} + path);

    std::ostringstream buffer;
    buffer << in.rdbuf();
    return buffer.str();
}

} // anonymous namespace

int main(int argc, char* argv[])
{
    if (argc < 2)
    {
        rwd::core::Log::error("usage: rewind_demo <script> [steps-per-second] [goal-x goal-y]");
        return 1;
    }

    auto script = readScript(argv[1]);
    if (!script)
    {
        rwd::core::Log::error(script.error().message());
        return 1;
    }

    const double speed = argc > 2 ? std::strtod(argv[2], nullptr) : 4.0;
    const int goalX = argc > 4 ? std::atoi(argv[3]) : 3;
    const int goalY = argc > 4 ? std::atoi(argv[4]) : 3;

    auto config = rwd::engine::Config::Builder{}
        .stepsPerSecond(speed)
        .tickIntervalMs(16.0)
        .playOnShortcutRun(true)
        .contextId(argv[1])
        .build();

    rwd::demo::GridInterpreter interpreter{50};
    TerminalEditor editor{*script};
    TerminalHost host{goalX, goalY};
    AutosaveFile autosave;
    rwd::engine::LoopClock clock;

    rwd::engine::ExecutionController controller{config, interpreter, editor, host, clock, &autosave};
    rwd::control::ControlSurface surface{controller, *script};

    // Same path as Ctrl+Enter in the editor: run, then play straight away.
    surface.handleKey(rwd::control::KeyEvent{rwd::control::Key::Enter, false, true, false}, true);
    if (controller.state() == rwd::engine::EditorState::Editing)
        return 1;

    clock.run();

    return host.succeeded() ? 0 : 2;
}
