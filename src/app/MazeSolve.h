#pragma once

#include <iosfwd>

#include "app/CommandLineArgs.h"
#include "core/Config.h"

namespace maze::app {

enum ExitCode : int {
    kExitSolved = 0,
    kExitNoSolution = 1, // also returned when the expansion budget runs out
    kExitUsage = 2,      // bad arguments or configuration
    kExitIo = 3,         // maze load or JSON output failure
};

// Loads --config (if any) and applies command-line overrides on top.
// Throws maze::ConfigError on an explicit config file that cannot be loaded,
// or on an unknown strategy / log level name.
[[nodiscard]] core::SolverConfig ResolveConfig(const CommandLineArgs& args);

// Body of maze_solve. Results go to `out`, usage errors to `err`; everything else
// is reported through the log.
[[nodiscard]] int RunMazeSolve(const CommandLineArgs& args, std::ostream& out, std::ostream& err);

} // namespace maze::app
