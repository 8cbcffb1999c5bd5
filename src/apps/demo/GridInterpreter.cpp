// /////////////////////////////////////////////////////////////////////////////
/// @file GridInterpreter.cpp
/// @brief Line-oriented parser and stepper for the demo grid world.
// /////////////////////////////////////////////////////////////////////////////

#include "GridInterpreter.hpp"

#include <rwd/core/Log.hpp>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <string>

namespace rwd::demo {

namespace {

struct Command
{
    std::string_view name;
    core::i32 dx;
    core::i32 dy;
};

constexpr Command kCommands[] = {
    {"move_up", 0, -1},
    {"move_down", 0, 1},
    {"move_left", -1, 0},
    {"move_right", 1, 0},
    {"wait", 0, 0},
};

bool isIdentChar(char c)
{
    return std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '_';
}

core::u32 skipSpaces(std::string_view line, core::u32 col)
{
    while (col < line.size() && std::isspace(static_cast<unsigned char>(line[col])) != 0)
        ++col;
    return col;
}

} // anonymous namespace

GridInterpreter::GridInterpreter(core::i32 fuel) : initialFuel_{fuel}
{
    reset();
}

void GridInterpreter::reset()
{
    state_ = GridState{0, 0, initialFuel_};
    frames_.clear();
}

engine::RunResult GridInterpreter::run(std::string_view script, std::string_view contextId)
{
    core::Log::debug("demo", "running script for '" + std::string{contextId} + "'");
    frames_.push_back(timeline::Frame::of(state_));

    core::u32 lineNo = 0;
    std::size_t pos = 0;
    while (pos <= script.size())
    {
        const std::size_t eol = std::min(script.find('\n', pos), script.size());
        std::string_view line = script.substr(pos, eol - pos);
        pos = eol + 1;
        ++lineNo;

        if (const auto comment = line.find("//"); comment != std::string_view::npos)
            line = line.substr(0, comment);

        core::u32 col = skipSpaces(line, 0);
        while (col < line.size())
        {
            const core::u32 nameStart = col;
            while (col < line.size() && isIdentChar(line[col]))
                ++col;
            const auto name = line.substr(nameStart, col - nameStart);
            if (name.empty())
                return std::unexpected(diagnostics::ScriptError::at(lineNo, nameStart, "unexpected character"));

            const auto* command = std::find_if(std::begin(kCommands), std::end(kCommands),
                                               [&](const Command& c) { return c.name == name; });
            if (command == std::end(kCommands))
            {
                return std::unexpected(diagnostics::ScriptError::at(
                    lineNo, nameStart, "function not found: " + std::string{name}));
            }

            col = skipSpaces(line, col);
            if (col >= line.size() || line[col] != '(')
                return std::unexpected(diagnostics::ScriptError::at(lineNo, col, "expecting '('"));
            col = skipSpaces(line, col + 1);

            core::i32 count = 0;
            const auto [end, ec] = std::from_chars(line.data() + col, line.data() + line.size(), count);
            if (ec != std::errc{} || count < 0)
                return std::unexpected(diagnostics::ScriptError::at(lineNo, col, "expecting a step count"));
            col = skipSpaces(line, static_cast<core::u32>(end - line.data()));

            if (col >= line.size() || line[col] != ')')
                return std::unexpected(diagnostics::ScriptError::at(lineNo, col, "expecting ')'"));
            col = skipSpaces(line, col + 1);
            if (col >= line.size() || line[col] != ';')
                return std::unexpected(diagnostics::ScriptError::at(lineNo, col, "expecting ';'"));
            col = skipSpaces(line, col + 1);

            for (core::i32 i = 0; i < count && state_.fuel > 0; ++i)
            {
                state_.x = std::clamp(state_.x + command->dx, 0, kBoardWidth - 1);
                state_.y = std::clamp(state_.y + command->dy, 0, kBoardHeight - 1);
                --state_.fuel;
                frames_.push_back(timeline::Frame::of(state_, lineNo));
            }
        }
    }

    return timeline::FrameSequence{std::move(frames_)};
}

} // namespace rwd::demo
