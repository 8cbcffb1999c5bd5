// /////////////////////////////////////////////////////////////////////////////
/// @file TextRange.hpp
/// @brief Editor-coordinate spans used for highlights and inline diagnostics.
// /////////////////////////////////////////////////////////////////////////////
#pragma once

#include <rwd/core/Types.hpp>

#include <string>
#include <string_view>

namespace rwd::diagnostics {

/// @brief Diagnostic severity, mirrored onto the host editor's lint levels.
enum class Severity : core::u8
{
    Error,
    Warning,
    Info
};

[[nodiscard]] constexpr std::string_view toString(Severity severity) noexcept
{
    switch (severity)
    {
    case Severity::Error:   return "error";
    case Severity::Warning: return "warning";
    case Severity::Info:    return "info";
    }
    return "unknown";
}

/// @brief One document line, excluding its terminator.
struct LineSpan
{
    core::usize start{0};
    core::usize length{0};

    [[nodiscard]] constexpr core::usize end() const noexcept { return start + length; }
};

/// @brief Half-open [from, to) offset pair.
struct OffsetRange
{
    core::usize from{0};
    core::usize to{0};

    [[nodiscard]] constexpr bool operator==(const OffsetRange&) const noexcept = default;
};

/// @brief Resolved diagnostic: from <= to <= document length.
struct TextRange
{
    core::usize from{0};
    core::usize to{0};
    std::string message;
    Severity severity{Severity::Error};

    [[nodiscard]] constexpr core::usize width() const noexcept { return to - from; }
};

} // namespace rwd::diagnostics
