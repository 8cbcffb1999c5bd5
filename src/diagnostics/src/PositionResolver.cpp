// /////////////////////////////////////////////////////////////////////////////
/// @file PositionResolver.cpp
/// @brief Error position resolution with backward word search.
// /////////////////////////////////////////////////////////////////////////////

#include <rwd/diagnostics/PositionResolver.hpp>
#include <rwd/core/Log.hpp>

#include <algorithm>
#include <string>

namespace rwd::diagnostics {

namespace {

TextRange makeRange(core::usize from, core::usize to, const std::string& message)
{
    return TextRange{from, to, message, Severity::Error};
}

} // anonymous namespace

core::Expected<TextRange> resolvePosition(const PositionedScriptError& error,
                                          const IDocumentLayout& document)
{
    const LineSpan span = RWD_TRY(document.lineSpanAt(error.line));

    if (span.length == 0)
        return makeRange(span.start, span.start, error.message);

    core::usize offset = std::min(span.start + error.column, span.end());

    auto word = document.wordRangeAt(offset);
    while (!word && offset > 0)
    {
        --offset;
        word = document.wordRangeAt(offset);
    }

    if (!word)
        return makeRange(span.start, span.start, error.message);

    const core::usize limit = document.documentLength();
    const core::usize to = std::min(word->to, limit);
    return makeRange(std::min(word->from, to), to, error.message);
}

TextRange resolveOrFallback(const PositionedScriptError& error, const IDocumentLayout& document)
{
    auto range = resolvePosition(error, document);
    if (range)
        return std::move(*range);

    core::Log::error("diag", "cannot place error at line " + std::to_string(error.line) +
                             ": " + range.error().message());
    return makeRange(0, 0, error.message);
}

} // namespace rwd::diagnostics
