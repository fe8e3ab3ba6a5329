// tests/test_command_line_args.cpp
//
// Regression coverage for src/app/CommandLineArgs.{h,cpp}.
//
// Goals:
//   - Option names are case-insensitive, values are not
//   - Both "--opt value" and "--opt=value" are supported
//   - Unknown options, bad values and valued flags are reported in command-line order

#include <doctest/doctest.h>

#include "app/CommandLineArgs.h"

#include <initializer_list>
#include <string_view>
#include <vector>

namespace {

[[nodiscard]] maze::app::CommandLineArgs Parse(std::initializer_list<std::string_view> argv)
{
    const std::vector<std::string_view> v(argv);
    return maze::app::ParseCommandLineArgsFromArgv(v);
}

} // namespace

TEST_CASE("CommandLineArgs parses maze file and value options")
{
    const auto args = Parse({
        "maze_solve",
        "mazes/Maze1.txt",
        "--strategy", "astar",
        "--JSON=out/Result.json",
        "--max-expansions", "250",
        "--show-explored",
    });

    REQUIRE(args.mazeFile);
    CHECK(*args.mazeFile == "mazes/Maze1.txt");
    REQUIRE(args.strategy);
    CHECK(*args.strategy == "astar");
    REQUIRE(args.jsonOut);
    CHECK(*args.jsonOut == "out/Result.json");
    REQUIRE(args.maxExpansions);
    CHECK(*args.maxExpansions == 250u);
    CHECK(args.showExplored.value_or(false));
    CHECK_FALSE(args.showHelp);
    CHECK(args.unknown.empty());
}

TEST_CASE("CommandLineArgs supports short aliases and help")
{
    const auto args = Parse({ "maze_solve", "-h", "-s", "bfs", "-c", "solver.json", "-o", "r.json" });

    CHECK(args.showHelp);
    CHECK(args.strategy.value_or("") == "bfs");
    CHECK(args.configFile.value_or("") == "solver.json");
    CHECK(args.jsonOut.value_or("") == "r.json");
    CHECK_FALSE(args.mazeFile);
}

TEST_CASE("CommandLineArgs leaves strategy names for later validation")
{
    const auto args = Parse({ "maze_solve", "m.txt", "--strategy=dijkstra", "--log-level", "chatty" });
    CHECK(args.strategy.value_or("") == "dijkstra");
    CHECK(args.logLevel.value_or("") == "chatty");
    CHECK(args.unknown.empty());
}

TEST_CASE("CommandLineArgs reports unknown options and bad values in order")
{
    const auto args = Parse({
        "maze_solve",
        "m.txt",
        "--bogus",
        "--max-expansions", "many",
        "extra.txt",
        "--strategy",
    });

    REQUIRE(args.unknown.size() == 4u);
    CHECK(args.unknown[0] == "--bogus");
    CHECK(args.unknown[1] == "--max-expansions");
    CHECK(args.unknown[2] == "extra.txt");
    CHECK(args.unknown[3] == "--strategy");
    CHECK_FALSE(args.maxExpansions);
    CHECK_FALSE(args.strategy);
}

TEST_CASE("CommandLineArgs --no-show-explored overrides config")
{
    const auto args = Parse({ "maze_solve", "m.txt", "--no-show-explored", "--log-file=run.log" });
    REQUIRE(args.showExplored);
    CHECK_FALSE(*args.showExplored);
    CHECK(args.logFile.value_or("") == "run.log");
}

TEST_CASE("CommandLineArgs rejects inline values on flags")
{
    const auto args = Parse({ "maze_solve", "m.txt", "--show-explored=false", "--HELP=1", "--no-show-explored=yes" });

    REQUIRE(args.unknown.size() == 3u);
    CHECK(args.unknown[0] == "--show-explored=false");
    CHECK(args.unknown[1] == "--HELP=1");
    CHECK(args.unknown[2] == "--no-show-explored=yes");
    CHECK_FALSE(args.showExplored);
    CHECK_FALSE(args.showHelp);
    REQUIRE(args.mazeFile);
    CHECK(*args.mazeFile == "m.txt");
}

TEST_CASE("CommandLineArgs help text mentions every option")
{
    const auto help = maze::app::BuildCommandLineHelpText();
    for (const char* opt : { "--strategy", "--config", "--json", "--show-explored",
                             "--max-expansions", "--log-level", "--log-file", "--help" })
    {
        CAPTURE(opt);
        CHECK(help.find(opt) != std::string::npos);
    }
}
