// /////////////////////////////////////////////////////////////////////////////
/// @file PositionResolver.hpp
/// @brief Maps interpreter (line, column) positions to editor text ranges.
// /////////////////////////////////////////////////////////////////////////////
#pragma once

#include <rwd/diagnostics/IDocumentLayout.hpp>
#include <rwd/diagnostics/ScriptError.hpp>
#include <rwd/diagnostics/TextRange.hpp>
#include <rwd/core/Expected.hpp>

namespace rwd::diagnostics {

/// @brief Resolve a positioned error to the word it points at.
///
/// The start offset is the line start plus the column, clamped to the line
/// end. When that character is not part of a word (interpreters often report
/// the delimiter after a token) the search walks backwards one character at
/// a time while the offset is above zero. A blank line, or a walk that finds
/// nothing, yields a zero-width range at the line start.
///
/// @return kOutOfRangeLine when the interpreter and the editor disagree on
///         the number of lines.
[[nodiscard]] core::Expected<TextRange> resolvePosition(const PositionedScriptError& error,
                                                        const IDocumentLayout& document);

/// @brief resolvePosition(), degrading kOutOfRangeLine to a zero-width range
///        at the document start (logged as an error, never thrown).
[[nodiscard]] TextRange resolveOrFallback(const PositionedScriptError& error,
                                          const IDocumentLayout& document);

} // namespace rwd::diagnostics
