#include "../src/chronicle.h"
#include "../src/game_config.h"

#include <catch2/catch.hpp>

#include <sstream>

TEST_CASE("config reads known keys", "[config]")
{
    std::istringstream in("# room window\n"
                          "width 1280\n"
                          "height 720\n"
                          "\n"
                          "fps 30\n"
                          "max_tick 0.05\n"
                          "seed 77\n"
                          "muted on\n"
                          "debug true\n"
                          "chronicle 40\n");
    GameConfig config;
    Chronicle log;

    REQUIRE(ParseConfig(in, config, log));
    REQUIRE(config.screenWidth == 1280);
    REQUIRE(config.screenHeight == 720);
    REQUIRE(config.targetFps == 30);
    REQUIRE(config.maxTickSeconds == Approx(0.05f));
    REQUIRE(config.driftSeed == 77u);
    REQUIRE(config.muted);
    REQUIRE(config.debugVisuals);
    REQUIRE(config.chronicleLines == 40u);
    REQUIRE(log.Lines().empty());
}

TEST_CASE("config clamps out of range numbers", "[config]")
{
    std::istringstream in("width 10\nfps 9000\nmax_tick 3\nchronicle 1\n");
    GameConfig config;
    Chronicle log;

    REQUIRE(ParseConfig(in, config, log));
    REQUIRE(config.screenWidth == 320);
    REQUIRE(config.targetFps == 240);
    REQUIRE(config.maxTickSeconds == Approx(0.25f));
    REQUIRE(config.chronicleLines == 4u);
}

TEST_CASE("config warns on unknown keys and bad values and keeps defaults", "[config]")
{
    std::istringstream in("width wide\nvolume 11\nmuted maybe\nheight 600\n");
    GameConfig config;
    Chronicle log;

    REQUIRE_FALSE(ParseConfig(in, config, log));
    REQUIRE(config.screenWidth == GameConfig{}.screenWidth);
    REQUIRE_FALSE(config.muted);
    REQUIRE(config.screenHeight == 600);
    REQUIRE(log.Contains("CONFIG WARNING // bad value for width at line 1"));
    REQUIRE(log.Contains("CONFIG WARNING // unknown key volume at line 2"));
    REQUIRE(log.Contains("CONFIG WARNING // bad value for muted at line 3"));
}

TEST_CASE("a missing config file falls back to defaults", "[config]")
{
    GameConfig config;
    config.targetFps = 45;
    Chronicle log;

    REQUIRE(LoadConfig("/nonexistent/pocket_spirits.cfg", config, log));
    REQUIRE(config.targetFps == 45);
    REQUIRE(log.Contains("CONFIG // defaults"));
}
