// /////////////////////////////////////////////////////////////////////////////
/// @file TextDocument.hpp
/// @brief IDocumentLayout over a plain script string.
// /////////////////////////////////////////////////////////////////////////////
#pragma once

#include <rwd/diagnostics/IDocumentLayout.hpp>

#include <string>
#include <string_view>
#include <vector>

namespace rwd::diagnostics {

/// @brief Line-indexed script text with identifier-style word boundaries.
///
/// Lines are split on '\n'; a trailing '\r' is excluded from the line span.
/// Word characters are ASCII letters, digits and '_'.
class TextDocument final : public IDocumentLayout
{
public:
    TextDocument();
    explicit TextDocument(std::string text);
    ~TextDocument() override;

    /// @brief Replace the whole text and rebuild the line index.
    void setText(std::string text);
    [[nodiscard]] const std::string& text() const noexcept;

    [[nodiscard]] core::usize lineCount() const noexcept override;
    [[nodiscard]] core::Expected<LineSpan> lineSpanAt(core::u32 line) const override;
    [[nodiscard]] std::optional<OffsetRange> wordRangeAt(core::usize offset) const override;
    [[nodiscard]] core::usize documentLength() const noexcept override;

    /// @brief Text covered by @p range (clamped to the document).
    [[nodiscard]] std::string_view slice(OffsetRange range) const noexcept;

    [[nodiscard]] static bool isWordChar(char c) noexcept;

private:
    void reindex();

    std::string text_;
    std::vector<LineSpan> lines_;
};

} // namespace rwd::diagnostics
