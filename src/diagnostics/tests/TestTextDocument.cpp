/**
 * @file TestTextDocument.cpp
 * @brief Unit tests for diagnostics::TextDocument, TextRange and ScriptError.
 */

#include <catch2/catch_test_macros.hpp>

#include "rwd/diagnostics/ScriptError.hpp"
#include "rwd/diagnostics/TextDocument.hpp"

namespace rwd::diagnostics {

TEST_CASE("TextDocument empty text has a single empty line", "[diagnostics][document]")
{
    TextDocument doc;

    REQUIRE(doc.lineCount() == 1);
    REQUIRE(doc.documentLength() == 0);

    auto span = doc.lineSpanAt(1);
    REQUIRE(span.has_value());
    REQUIRE(span->start == 0);
    REQUIRE(span->length == 0);
}

TEST_CASE("TextDocument indexes lines and drops carriage returns", "[diagnostics][document]")
{
    TextDocument doc{"ab\r\ncde\n"};

    REQUIRE(doc.lineCount() == 3);
    REQUIRE(doc.lineSpanAt(1)->length == 2);
    REQUIRE(doc.lineSpanAt(2)->start == 4);
    REQUIRE(doc.lineSpanAt(2)->end() == 7);
    REQUIRE(doc.lineSpanAt(3)->length == 0);
}

TEST_CASE("TextDocument setText reindexes the lines", "[diagnostics][document]")
{
    TextDocument doc{"a"};
    doc.setText("a\nb\nc");

    REQUIRE(doc.lineCount() == 3);
    REQUIRE(doc.text() == "a\nb\nc");
    REQUIRE_FALSE(doc.lineSpanAt(4).has_value());
}

TEST_CASE("TextDocument wordRangeAt spans identifier characters", "[diagnostics][document]")
{
    TextDocument doc{"move_up(12);"};

    REQUIRE(doc.wordRangeAt(3) == OffsetRange{0, 7});
    REQUIRE(doc.wordRangeAt(0) == OffsetRange{0, 7});
    REQUIRE(doc.wordRangeAt(9) == OffsetRange{8, 10});
    REQUIRE_FALSE(doc.wordRangeAt(7).has_value());
    REQUIRE_FALSE(doc.wordRangeAt(12).has_value());
}

TEST_CASE("ScriptError distinguishes positioned from unpositioned", "[diagnostics][error]")
{
    const auto positioned = ScriptError::at(3, 4, "function not found: jump");
    REQUIRE(positioned.isPositioned());
    REQUIRE(positioned.positioned()->line == 3);
    REQUIRE(positioned.positioned()->column == 4);
    REQUIRE(positioned.message() == "function not found: jump");

    const auto plain = ScriptError::unpositioned("out of fuel");
    REQUIRE_FALSE(plain.isPositioned());
    REQUIRE(plain.positioned() == nullptr);
    REQUIRE(plain.message() == "out of fuel");
}

TEST_CASE("Severity names match editor lint levels", "[diagnostics][range]")
{
    REQUIRE(toString(Severity::Error) == "error");
    REQUIRE(toString(Severity::Warning) == "warning");
    REQUIRE(toString(Severity::Info) == "info");

    const TextRange range{3, 7, "unused", Severity::Warning};
    REQUIRE(range.width() == 4);
    REQUIRE(toString(range.severity) == "warning");
}

} // namespace rwd::diagnostics
