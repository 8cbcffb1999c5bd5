/**
 * @file TestCore.cpp
 * @brief Unit tests for core logging and error propagation.
 */

#include <catch2/catch_test_macros.hpp>

#include "rwd/core/Expected.hpp"
#include "rwd/core/Log.hpp"

#include <string>
#include <vector>

namespace rwd::core {

namespace {

class CapturingLogger final : public ILogger {
public:
    struct Entry
    {
        LogLevel level;
        std::string tag;
        std::string message;
    };

    std::vector<Entry> entries;

    void write(LogLevel level, std::string_view tag, std::string_view message) override
    {
        entries.push_back(Entry{level, std::string{tag}, std::string{message}});
    }
};

/// Restores the default sink and threshold when a test ends.
struct LoggerScope
{
    CapturingLogger logger;
    LogLevel previous{Log::minLevel()};

    LoggerScope() { Log::setLogger(&logger); }
    ~LoggerScope()
    {
        Log::setLogger(nullptr);
        Log::setMinLevel(previous);
    }
};

Expected<int> parsePositive(int value)
{
    if (value <= 0)
        return makeError(ErrorCode::kInvalidArgument, "expected a positive value");
    return value;
}

Expected<int> doubled(int value)
{
    const int parsed = RWD_TRY(parsePositive(value));
    return parsed * 2;
}

ExpectedVoid check(int value)
{
    RWD_TRY_VOID(parsePositive(value));
    return {};
}

} // anonymous namespace

TEST_CASE("Log routes messages through the installed logger", "[core][log]")
{
    LoggerScope scope;
    Log::setMinLevel(LogLevel::kDebug);

    Log::info("engine", "staged");
    Log::warn("plain");

    REQUIRE(scope.logger.entries.size() == 2);
    REQUIRE(scope.logger.entries[0].tag == "engine");
    REQUIRE(scope.logger.entries[0].message == "staged");
    REQUIRE(scope.logger.entries[1].level == LogLevel::kWarn);
    REQUIRE(scope.logger.entries[1].tag == "rwd");
}

TEST_CASE("Log drops messages below the minimum level", "[core][log]")
{
    LoggerScope scope;
    Log::setMinLevel(LogLevel::kWarn);

    Log::debug("timeline", "tick");
    Log::info("timeline", "tick");
    Log::error("timeline", "lost");

    REQUIRE(scope.logger.entries.size() == 1);
    REQUIRE(scope.logger.entries[0].level == LogLevel::kError);
}

TEST_CASE("RWD_TRY propagates the first error", "[core][error]")
{
    REQUIRE(doubled(4).value() == 8);

    auto failed = doubled(-1);
    REQUIRE_FALSE(failed.has_value());
    REQUIRE(failed.error().code() == ErrorCode::kInvalidArgument);
    REQUIRE(failed.error().message() == "expected a positive value");

    REQUIRE(check(1).has_value());
    REQUIRE_FALSE(check(0).has_value());
}

TEST_CASE("ErrorCode names are stable", "[core][error]")
{
    REQUIRE(toString(ErrorCode::kInvalidState) == "invalid state");
    REQUIRE(toString(ErrorCode::kOutOfRangeLine) == "line out of range");
}

} // namespace rwd::core
