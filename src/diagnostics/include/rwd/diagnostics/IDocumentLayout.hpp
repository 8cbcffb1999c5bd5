// /////////////////////////////////////////////////////////////////////////////
/// @file IDocumentLayout.hpp
/// @brief Read-only view of the edited script's line and word structure.
// /////////////////////////////////////////////////////////////////////////////
#pragma once

#include <rwd/diagnostics/TextRange.hpp>
#include <rwd/core/Types.hpp>
#include <rwd/core/Expected.hpp>

#include <optional>

namespace rwd::diagnostics {

// /////////////////////////////////////////////////////////////////////////////
/// @class IDocumentLayout
/// @brief Capability interface over the host editor's document model.
///
/// Implemented by the host's text widget adapter, or by TextDocument.
// /////////////////////////////////////////////////////////////////////////////
class IDocumentLayout
{
public:
    virtual ~IDocumentLayout() = default;

    /// @brief Number of lines; an empty document still has one.
    [[nodiscard]] virtual core::usize lineCount() const noexcept = 0;

    /// @brief Span of a 1-based line.
    /// @return kOutOfRangeLine when @p line is 0 or past lineCount().
    [[nodiscard]] virtual core::Expected<LineSpan> lineSpanAt(core::u32 line) const = 0;

    /// @brief Word (identifier or number token) covering the character at
    ///        @p offset, or nullopt when that character is not a word character.
    [[nodiscard]] virtual std::optional<OffsetRange> wordRangeAt(core::usize offset) const = 0;

    /// @brief Total length in characters.
    [[nodiscard]] virtual core::usize documentLength() const noexcept = 0;
};

} // namespace rwd::diagnostics
