// /////////////////////////////////////////////////////////////////////////////
/// @file ScriptStats.cpp
/// @brief Script metric helpers.
// /////////////////////////////////////////////////////////////////////////////

#include <rwd/diagnostics/ScriptStats.hpp>

#include <cctype>

namespace rwd::diagnostics {

core::usize codeLength(std::string_view script) noexcept
{
    enum class Mode { Code, String, LineComment, BlockComment };

    Mode mode = Mode::Code;
    core::usize count = 0;

    for (core::usize i = 0; i < script.size(); ++i)
    {
        const char c = script[i];
        const char next = i + 1 < script.size() ? script[i + 1] : '\0';

        switch (mode)
        {
        case Mode::Code:
            if (c == '/' && next == '/')
            {
                mode = Mode::LineComment;
                ++i;
                continue;
            }
            if (c == '/' && next == '*')
            {
                mode = Mode::BlockComment;
                ++i;
                continue;
            }
            if (c == '"')
                mode = Mode::String;
            break;
        case Mode::String:
            if (c == '\\' && next != '\0')
            {
                count += 2;
                ++i;
                continue;
            }
            if (c == '"')
                mode = Mode::Code;
            break;
        case Mode::LineComment:
            if (c == '\n')
                mode = Mode::Code;
            continue;
        case Mode::BlockComment:
            if (c == '*' && next == '/')
            {
                mode = Mode::Code;
                ++i;
            }
            continue;
        }

        if (std::isspace(static_cast<unsigned char>(c)) == 0)
            ++count;
    }
    return count;
}

} // namespace rwd::diagnostics
