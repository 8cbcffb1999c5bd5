/**
 * @file TestPositionResolver.cpp
 * @brief Unit tests for diagnostics::resolvePosition and resolveOrFallback.
 */

#include <catch2/catch_test_macros.hpp>

#include "rwd/diagnostics/PositionResolver.hpp"
#include "rwd/diagnostics/TextDocument.hpp"

namespace rwd::diagnostics {

namespace {

PositionedScriptError errorAt(core::u32 line, core::u32 column)
{
    return PositionedScriptError{line, column, "unexpected token"};
}

} // anonymous namespace

TEST_CASE("resolvePosition walks back from whitespace to the previous word", "[diagnostics][resolver]")
{
    TextDocument doc{"x = y + 1"};

    auto range = resolvePosition(errorAt(1, 5), doc);
    REQUIRE(range.has_value());
    REQUIRE(range->from == 4);
    REQUIRE(range->to == 5);
    REQUIRE(doc.slice({range->from, range->to}) == "y");
    REQUIRE(range->message == "unexpected token");
    REQUIRE(range->severity == Severity::Error);
}

TEST_CASE("resolvePosition skips punctuation to reach a word", "[diagnostics][resolver]")
{
    TextDocument doc{"x = y + 1"};

    auto range = resolvePosition(errorAt(1, 6), doc);
    REQUIRE(range.has_value());
    REQUIRE(doc.slice({range->from, range->to}) == "y");
}

TEST_CASE("resolvePosition covers the whole word under the column", "[diagnostics][resolver]")
{
    TextDocument doc{"let value = 3;\nmove_right(fooo);"};

    auto range = resolvePosition(errorAt(2, 13), doc);
    REQUIRE(range.has_value());
    REQUIRE(doc.slice({range->from, range->to}) == "fooo");
    REQUIRE(range->from == 26);
}

TEST_CASE("resolvePosition marks a blank line with a zero-width range", "[diagnostics][resolver]")
{
    TextDocument doc{"a\n\nb"};

    auto range = resolvePosition(errorAt(2, 4), doc);
    REQUIRE(range.has_value());
    REQUIRE(range->from == 2);
    REQUIRE(range->to == 2);
    REQUIRE(range->width() == 0);
}

TEST_CASE("resolvePosition handles an empty document", "[diagnostics][resolver]")
{
    TextDocument doc{""};

    auto range = resolvePosition(errorAt(1, 0), doc);
    REQUIRE(range.has_value());
    REQUIRE(range->from == 0);
    REQUIRE(range->to == 0);
    REQUIRE(range->message == "unexpected token");
}

TEST_CASE("resolvePosition clamps a column past the end of the line", "[diagnostics][resolver]")
{
    TextDocument doc{"ab\ncd"};

    auto range = resolvePosition(errorAt(1, 40), doc);
    REQUIRE(range.has_value());
    REQUIRE(range->from == 0);
    REQUIRE(range->to == 2);
}

TEST_CASE("resolvePosition continues the search onto earlier lines", "[diagnostics][resolver]")
{
    TextDocument doc{"ab\n;;"};

    auto range = resolvePosition(errorAt(2, 1), doc);
    REQUIRE(range.has_value());
    REQUIRE(doc.slice({range->from, range->to}) == "ab");
}

TEST_CASE("resolvePosition falls back to the line start without any word", "[diagnostics][resolver]")
{
    TextDocument doc{";; ("};

    auto range = resolvePosition(errorAt(1, 3), doc);
    REQUIRE(range.has_value());
    REQUIRE(range->from == 0);
    REQUIRE(range->to == 0);
}

TEST_CASE("resolvePosition ignores the carriage return of CRLF lines", "[diagnostics][resolver]")
{
    TextDocument doc{"foo\r\nbar baz\r\n"};

    auto range = resolvePosition(errorAt(2, 5), doc);
    REQUIRE(range.has_value());
    REQUIRE(doc.slice({range->from, range->to}) == "baz");
}

TEST_CASE("resolvePosition reports lines outside the document", "[diagnostics][resolver]")
{
    TextDocument doc{"one\ntwo"};

    auto past = resolvePosition(errorAt(3, 0), doc);
    REQUIRE_FALSE(past.has_value());
    REQUIRE(past.error().code() == core::ErrorCode::kOutOfRangeLine);

    auto zero = resolvePosition(errorAt(0, 0), doc);
    REQUIRE_FALSE(zero.has_value());
    REQUIRE(zero.error().code() == core::ErrorCode::kOutOfRangeLine);
}

TEST_CASE("resolveOrFallback pins unplaceable errors to the document start", "[diagnostics][resolver]")
{
    TextDocument doc{"one\ntwo"};

    const auto range = resolveOrFallback(PositionedScriptError{12, 3, "boom"}, doc);
    REQUIRE(range.from == 0);
    REQUIRE(range.to == 0);
    REQUIRE(range.message == "boom");
}

TEST_CASE("resolveOrFallback passes resolvable errors through", "[diagnostics][resolver]")
{
    TextDocument doc{"one\ntwo"};

    const auto range = resolveOrFallback(errorAt(2, 1), doc);
    REQUIRE(range.from == 4);
    REQUIRE(range.to == 7);
}

} // namespace rwd::diagnostics
