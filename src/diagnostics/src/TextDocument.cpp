// /////////////////////////////////////////////////////////////////////////////
/// @file TextDocument.cpp
/// @brief TextDocument implementation.
// /////////////////////////////////////////////////////////////////////////////

#include <rwd/diagnostics/TextDocument.hpp>

#include <algorithm>
#include <cctype>

namespace rwd::diagnostics {

TextDocument::TextDocument() { reindex(); }
TextDocument::TextDocument(std::string text) : text_{std::move(text)} { reindex(); }
TextDocument::~TextDocument() = default;

void TextDocument::setText(std::string text)
{
    text_ = std::move(text);
    reindex();
}

const std::string& TextDocument::text() const noexcept
{
    return text_;
}

core::usize TextDocument::lineCount() const noexcept
{
    return lines_.size();
}

core::Expected<LineSpan> TextDocument::lineSpanAt(core::u32 line) const
{
    if (line == 0 || line > lines_.size())
    {
        return core::makeError(core::ErrorCode::kOutOfRangeLine,
                               "line " + std::to_string(line) + " not in document of " +
                               std::to_string(lines_.size()) + " lines");
    }
    return lines_[line - 1];
}

std::optional<OffsetRange> TextDocument::wordRangeAt(core::usize offset) const
{
    if (offset >= text_.size() || !isWordChar(text_[offset]))
        return std::nullopt;

    core::usize from = offset;
    while (from > 0 && isWordChar(text_[from - 1]))
        --from;

    core::usize to = offset + 1;
    while (to < text_.size() && isWordChar(text_[to]))
        ++to;

    return OffsetRange{from, to};
}

core::usize TextDocument::documentLength() const noexcept
{
    return text_.size();
}

std::string_view TextDocument::slice(OffsetRange range) const noexcept
{
    const core::usize from = std::min(range.from, text_.size());
    const core::usize to = std::clamp(range.to, from, text_.size());
    return std::string_view{text_}.substr(from, to - from);
}

bool TextDocument::isWordChar(char c) noexcept
{
    return std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '_';
}

void TextDocument::reindex()
{
    lines_.clear();

    core::usize start = 0;
    for (core::usize i = 0; i <= text_.size(); ++i)
    {
        if (i != text_.size() && text_[i] != '\n')
            continue;

        core::usize end = i;
        if (end > start && text_[end - 1] == '\r')
            --end;
        lines_.push_back(LineSpan{start, end - start});
        start = i + 1;
    }
}

} // namespace rwd::diagnostics
