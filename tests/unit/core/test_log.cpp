#include "steptrack/Log.hpp"
#include <catch2/catch_test_macros.hpp>
#include <catch2/generators/catch_generators.hpp>
#include <stdlib.h>
#include <string>

using steptrack::logx::Level;
namespace logx = steptrack::logx;

TEST_CASE("Level names parse case-insensitively", "[log]")
{
    const auto [name, expected] = GENERATE(table<const char*, Level>({
        {"quiet", Level::Quiet},
        {"error", Level::Error},
        {"warn", Level::Warn},
        {"warning", Level::Warn},
        {"info", Level::Info},
        {"debug", Level::Debug},
        {"DEBUG", Level::Debug},
        {"Warning", Level::Warn},
        {"QuIeT", Level::Quiet},
    }));
    CAPTURE(name);
    CHECK(logx::level_from_string(name) == expected);
    CHECK(logx::level_from_string(name, Level::Error) == expected);
}

TEST_CASE("Unknown level names fall back", "[log]")
{
    for (const char* s : {"", "chatty", "verbose", " info", "warn "})
    {
        CAPTURE(s);
        CHECK(logx::level_from_string(s) == Level::Info);
        CHECK(logx::level_from_string(s, Level::Error) == Level::Error);
        // Quiet as fallback marks "unknown"; only the literal name maps to it otherwise.
        CHECK(logx::level_from_string(s, Level::Quiet) == Level::Quiet);
    }
    CHECK(logx::level_from_string("debug", Level::Quiet) == Level::Debug);
}

TEST_CASE("STEPTRACK_LOG selects the level from the environment", "[log][env]")
{
    ::unsetenv("STEPTRACK_LOG");
    CHECK(logx::level_from_env() == Level::Info);

    ::setenv("STEPTRACK_LOG", "debug", 1);
    CHECK(logx::level_from_env() == Level::Debug);

    ::setenv("STEPTRACK_LOG", "Quiet", 1);
    CHECK(logx::level_from_env() == Level::Quiet);

    ::setenv("STEPTRACK_LOG", "loud", 1);
    CHECK(logx::level_from_env() == Level::Info);

    ::unsetenv("STEPTRACK_LOG");
}

TEST_CASE("init lets the environment override only the Info default", "[log][env]")
{
    ::setenv("STEPTRACK_LOG", "error", 1);

    logx::init({Level::Info, false});
    CHECK(logx::level() == Level::Error);

    logx::init({Level::Debug, false});
    CHECK(logx::level() == Level::Debug);

    logx::init({Level::Quiet, false});
    CHECK(logx::level() == Level::Quiet);

    ::unsetenv("STEPTRACK_LOG");
    logx::init();
    CHECK(logx::level() == Level::Info);
}

TEST_CASE("gate filters messages above the current level", "[log]")
{
    ::unsetenv("STEPTRACK_LOG");

    logx::init({Level::Warn, false});
    CHECK_FALSE(logx::gate(Level::Error));
    CHECK_FALSE(logx::gate(Level::Warn));
    CHECK(logx::gate(Level::Info));
    CHECK(logx::gate(Level::Debug));

    logx::init({Level::Quiet, false});
    CHECK(logx::gate(Level::Error));

    logx::init();
    CHECK_FALSE(logx::gate(Level::Info));
    CHECK(logx::gate(Level::Debug));
}
