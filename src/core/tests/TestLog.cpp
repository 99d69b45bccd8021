/**
 * @file TestLog.cpp
 * @brief Unit tests for the core::Log façade.
 */

#include <catch2/catch_test_macros.hpp>

#include "hop/core/Log.hpp"

#include <string>
#include <vector>

namespace hop::core {

namespace {

struct Line {
    LogLevel    level;
    std::string tag;
    std::string message;
};

class CapturingLogger final : public ILogger {
public:
    void write(LogLevel level, std::string_view tag, std::string_view message) override
    {
        lines.push_back(Line{level, std::string{tag}, std::string{message}});
    }

    std::vector<Line> lines;
};

/// Restores the process-wide minimum level on exit.
struct MinLevelGuard {
    LogLevel saved = Log::minLevel();
    ~MinLevelGuard() { Log::setMinLevel(saved); }
};

} // namespace

TEST_CASE("Messages reach the installed logger with their tag", "[core][log]")
{
    MinLevelGuard guard;
    CapturingLogger sink;
    ScopedLogger scoped{sink};
    Log::setMinLevel(LogLevel::kDebug);

    Log::debug("delta", "3 pages changed");
    Log::error("migration", "transport failure");

    REQUIRE(sink.lines.size() == 2);
    REQUIRE(sink.lines[0].level == LogLevel::kDebug);
    REQUIRE(sink.lines[0].tag == "delta");
    REQUIRE(sink.lines[1].tag == "migration");
    REQUIRE(sink.lines[1].message == "transport failure");
}

TEST_CASE("Messages below the minimum level are dropped", "[core][log]")
{
    MinLevelGuard guard;
    CapturingLogger sink;
    ScopedLogger scoped{sink};
    Log::setMinLevel(LogLevel::kWarn);

    Log::debug("liveness", "tick");
    Log::info("liveness", "started");
    Log::warn("liveness", "peer suspect");
    Log::fatal("node", "migration failed");

    REQUIRE_FALSE(Log::enabled(LogLevel::kInfo));
    REQUIRE(Log::enabled(LogLevel::kError));
    REQUIRE(sink.lines.size() == 2);
    REQUIRE(sink.lines[0].level == LogLevel::kWarn);
    REQUIRE(sink.lines[1].level == LogLevel::kFatal);
}

TEST_CASE("ScopedLogger restores the previous sink", "[core][log]")
{
    MinLevelGuard guard;
    Log::setMinLevel(LogLevel::kInfo);

    CapturingLogger outer;
    CapturingLogger inner;
    {
        ScopedLogger first{outer};
        {
            ScopedLogger second{inner};
            Log::info("net", "inner");
        }
        Log::info("net", "outer");
    }

    REQUIRE(inner.lines.size() == 1);
    REQUIRE(outer.lines.size() == 1);
    REQUIRE(outer.lines[0].message == "outer");
}

TEST_CASE("Level names have a fixed width", "[core][log]")
{
    REQUIRE(toString(LogLevel::kInfo) == "INFO ");
    REQUIRE(toString(LogLevel::kError) == "ERROR");
    REQUIRE(toString(LogLevel::kWarn).size() == toString(LogLevel::kDebug).size());
}

} // namespace hop::core
