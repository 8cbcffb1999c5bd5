// /////////////////////////////////////////////////////////////////////////////
/// @file ScriptError.hpp
/// @brief Failure reported by the interpreter for one run attempt.
// /////////////////////////////////////////////////////////////////////////////
#pragma once

#include <rwd/core/Types.hpp>

#include <string>
#include <variant>

namespace rwd::diagnostics {

/// @brief Compile or runtime error with a known source location.
struct PositionedScriptError
{
    core::u32 line{1};      ///< 1-based.
    core::u32 column{0};    ///< 0-based, relative to the line start.
    std::string message;
};

/// @brief Failure with no usable location (host exception, internal fault).
struct UnpositionedScriptError
{
    std::string message;
};

/// @brief Tagged script error.
class ScriptError
{
public:
    ScriptError(PositionedScriptError error) : error_{std::move(error)} {}
    ScriptError(UnpositionedScriptError error) : error_{std::move(error)} {}

    [[nodiscard]] static ScriptError at(core::u32 line, core::u32 column, std::string message)
    {
        return PositionedScriptError{line, column, std::move(message)};
    }

    [[nodiscard]] static ScriptError unpositioned(std::string message)
    {
        return UnpositionedScriptError{std::move(message)};
    }

    [[nodiscard]] bool isPositioned() const noexcept
    {
        return std::holds_alternative<PositionedScriptError>(error_);
    }

    /// @brief Positioned payload, or nullptr.
    [[nodiscard]] const PositionedScriptError* positioned() const noexcept
    {
        return std::get_if<PositionedScriptError>(&error_);
    }

    [[nodiscard]] const std::string& message() const noexcept
    {
        if (const auto* p = positioned())
            return p->message;
        return std::get<UnpositionedScriptError>(error_).message;
    }

private:
    std::variant<PositionedScriptError, UnpositionedScriptError> error_;
};

} // namespace rwd::diagnostics
