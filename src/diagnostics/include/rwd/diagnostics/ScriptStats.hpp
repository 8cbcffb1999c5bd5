// /////////////////////////////////////////////////////////////////////////////
/// @file ScriptStats.hpp
/// @brief Size metrics reported to the host when a replay completes.
// /////////////////////////////////////////////////////////////////////////////
#pragma once

#include <rwd/core/Types.hpp>

#include <string_view>

namespace rwd::diagnostics {

/// @brief Number of characters in @p script excluding whitespace and
///        comments ("//" to end of line, "/* ... */").
///
/// Comment markers inside double-quoted string literals are not comments.
[[nodiscard]] core::usize codeLength(std::string_view script) noexcept;

} // namespace rwd::diagnostics
