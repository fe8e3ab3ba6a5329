#pragma once

#include <cstddef>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace maze::app {

// Parsed command-line arguments for the maze_solve executable.
//
// Notes:
//   - Option names are case-insensitive; values keep their case.
//   - Both "--flag=value" and "--flag value" forms are supported.
//   - Strategy and log level names are validated later, against the merged config.
struct CommandLineArgs
{
    bool showHelp = false;                      // --help / -h

    std::optional<std::string> mazeFile;        // first positional argument
    std::optional<std::string> strategy;        // --strategy <bfs|queue|astar>
    std::optional<std::string> configFile;      // --config <file.json>
    std::optional<std::string> jsonOut;         // --json <out.json>
    std::optional<bool> showExplored;           // --show-explored / --no-show-explored
    std::optional<std::size_t> maxExpansions;   // --max-expansions <N>
    std::optional<std::string> logLevel;        // --log-level <name>
    std::optional<std::string> logFile;         // --log-file <path>

    // Unknown options, bad values (a value on a flag included) and extra positionals,
    // in command-line order.
    std::vector<std::string> unknown;
};

// argv[0] is skipped.
[[nodiscard]] CommandLineArgs ParseCommandLineArgsFromArgv(std::span<const std::string_view> argv);
[[nodiscard]] CommandLineArgs ParseCommandLineArgs(int argc, char** argv);

[[nodiscard]] std::string BuildCommandLineHelpText();

} // namespace maze::app
