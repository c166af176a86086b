// tests/test_command_line_args.cpp
//
// Regression coverage for src/app/CommandLineArgs.{h,cpp}.
//
// Goals:
//   - Options are case-insensitive, values keep their case
//   - Both "--opt value" and "--opt=value" are supported
//   - Unknown options and missing values are reported in order

#include <doctest/doctest.h>

#include "app/CommandLineArgs.h"

#include <string>
#include <vector>

using nooku::app::CommandLineArgs;
using nooku::app::ParseCommandLineArgs;

TEST_CASE("CommandLineArgs parses flags (case-insensitive)")
{
    const auto args = ParseCommandLineArgs(std::vector<std::string>{"--HELP", "--Write-Config"});
    CHECK(args.showHelp);
    CHECK(args.writeConfig);
    CHECK(args.unknown.empty());
}

TEST_CASE("CommandLineArgs accepts --opt value and --opt=value")
{
    const auto args = ParseCommandLineArgs(std::vector<std::string>{
        "--config", "/etc/Nooku.ini",
        "--SONGS=/srv/Music",
        "--log-dir", "Logs",
    });

    REQUIRE(args.configPath.has_value());
    REQUIRE(args.songsDir.has_value());
    REQUIRE(args.logDir.has_value());
    CHECK(*args.configPath == "/etc/Nooku.ini");
    CHECK(*args.songsDir == "/srv/Music");
    CHECK(*args.logDir == "Logs");
    CHECK(args.unknown.empty());
}

TEST_CASE("CommandLineArgs reports unknown options and missing values")
{
    const auto args = ParseCommandLineArgs(std::vector<std::string>{
        "--volume", "3",
        "--songs=",
        "--config",
    });

    REQUIRE(args.unknown.size() == 4);
    CHECK(args.unknown[0] == "--volume");
    CHECK(args.unknown[1] == "3");
    CHECK(args.unknown[2] == "--songs=");
    CHECK(args.unknown[3] == "--config");
    CHECK_FALSE(args.songsDir.has_value());
    CHECK_FALSE(args.configPath.has_value());
}

TEST_CASE("CommandLineArgs skips argv[0]")
{
    const char* argv[] = {"nooku", "-h"};
    const auto args = ParseCommandLineArgs(2, argv);
    CHECK(args.showHelp);
    CHECK(args.unknown.empty());
}

TEST_CASE("CommandLineArgs help text lists options and console commands")
{
    const std::string help = nooku::app::BuildCommandLineHelpText();
    CHECK(help.find("--songs") != std::string::npos);
    CHECK(help.find("--write-config") != std::string::npos);
    CHECK(help.find("play <channel>") != std::string::npos);
    CHECK(help.find("mute <channel>") != std::string::npos);
    CHECK(help.find("history [n]") != std::string::npos);
}
