/**
 * @file TestLog.cpp
 * @brief Unit tests for the logging facade and error helpers.
 */

#include <catch2/catch_test_macros.hpp>

#include "rwn/core/Error.hpp"
#include "rwn/core/Log.hpp"

#include <string>
#include <vector>

namespace rwn::core {

namespace {

struct CapturingLogger final : ILogger
{
    struct Entry
    {
        LogLevel    level;
        std::string tag;
        std::string message;
    };

    void write(LogLevel level, std::string_view tag, std::string_view message) override
    {
        entries.push_back({level, std::string{tag}, std::string{message}});
    }

    std::vector<Entry> entries;
};

} // namespace

TEST_CASE("Log routes messages to the installed logger", "[core][log]")
{
    CapturingLogger logger;
    Log::setLogger(&logger);
    Log::setMinLevel(LogLevel::kDebug);

    Log::debug("InputQueue", "hello");
    Log::warn("bare");

    Log::setLogger(nullptr);
    Log::setMinLevel(LogLevel::kInfo);

    REQUIRE(logger.entries.size() == 2);
    REQUIRE(logger.entries[0].tag == "InputQueue");
    REQUIRE(logger.entries[0].level == LogLevel::kDebug);
    REQUIRE(logger.entries[1].tag == "rwn");
    REQUIRE(logger.entries[1].message == "bare");
}

TEST_CASE("Log filters below the minimum level", "[core][log]")
{
    CapturingLogger logger;
    Log::setLogger(&logger);
    Log::setMinLevel(LogLevel::kWarn);

    Log::info("Tag", "dropped");
    Log::error("Tag", "kept");

    Log::setLogger(nullptr);
    Log::setMinLevel(LogLevel::kInfo);

    REQUIRE(logger.entries.size() == 1);
    REQUIRE(logger.entries[0].message == "kept");
}

TEST_CASE("Log level parses from text", "[core][log]")
{
    REQUIRE(Log::setMinLevel(std::string_view{"error"}));
    REQUIRE(Log::minLevel() == LogLevel::kError);
    REQUIRE_FALSE(Log::setMinLevel(std::string_view{"loud"}));
    REQUIRE(Log::minLevel() == LogLevel::kError);
    Log::setMinLevel(LogLevel::kInfo);
}

TEST_CASE("Error describes itself and classifies fatality", "[core][error]")
{
    Error err{ErrorCode::kDesyncDetected, "frame 40"};
    REQUIRE(err.describe() == "DesyncDetected: frame 40");
    REQUIRE(err.fatal());
    REQUIRE_FALSE(isFatal(ErrorCode::kPredictionThreshold));
    REQUIRE(isFatal(ErrorCode::kPredictionWindowExceeded));

    auto unexpected = makeError(ErrorCode::kNotFound, "missing");
    REQUIRE(unexpected.error().code() == ErrorCode::kNotFound);
}

} // namespace rwn::core
