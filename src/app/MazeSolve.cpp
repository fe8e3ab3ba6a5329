#include "app/MazeSolve.h"

#include "logging/Log.h"
#include "maze/Errors.hpp"
#include "maze/io/MazeText.hpp"
#include "maze/io/ResultJson.hpp"
#include "maze/pathfinding/Search.hpp"

#include <ostream>
#include <string>

#include <spdlog/spdlog.h>

namespace maze::app {

core::SolverConfig ResolveConfig(const CommandLineArgs& args)
{
    core::SolverConfig cfg;
    if (args.configFile && !core::LoadSolverConfig(cfg, *args.configFile))
        throw ConfigError("could not load config file " + *args.configFile);

    if (args.strategy)      cfg.strategy = pf::parse_strategy(*args.strategy);
    if (args.maxExpansions) cfg.maxExpansions = *args.maxExpansions;
    if (args.showExplored)  cfg.showExplored = *args.showExplored;
    if (args.logLevel)      cfg.logLevel = logsys::parse_level(*args.logLevel);
    if (args.logFile)       cfg.logFile = *args.logFile;
    return cfg;
}

int RunMazeSolve(const CommandLineArgs& args, std::ostream& out, std::ostream& err)
{
    if (args.showHelp) {
        out << BuildCommandLineHelpText();
        return kExitSolved;
    }

    if (!args.unknown.empty() || !args.mazeFile) {
        for (const auto& u : args.unknown)
            err << "maze_solve: unrecognized or invalid argument: " << u << '\n';
        if (!args.mazeFile)
            err << "maze_solve: missing maze file\n";
        err << BuildCommandLineHelpText();
        return kExitUsage;
    }

    core::SolverConfig cfg;
    try {
        cfg = ResolveConfig(args);
    } catch (const ConfigError& e) {
        spdlog::error("{}", e.what());
        return kExitUsage;
    }
    logsys::init({ cfg.logLevel, cfg.logFile });

    try {
        const pf::Grid grid = io::load_maze_file(*args.mazeFile);

        out << "Maze:" << io::render_text(grid);
        out << "Solving..." << std::endl;

        const pf::SearchResult result = pf::solve(grid, cfg.strategy, { cfg.maxExpansions });

        out << "States Explored: " << result.explored_count << '\n';
        if (result.found()) {
            io::RenderOptions ro;
            ro.show_explored = cfg.showExplored;
            out << "Solution:" << io::render_text(grid, &result, ro);
            out << "Path length: " << result.solution->length() << '\n';
        } else {
            out << (result.status == pf::SearchStatus::BudgetExhausted
                        ? "Stopped: expansion limit reached\n"
                        : "No solution\n");
        }

        if (args.jsonOut)
            io::write_json_file(io::to_json(grid, result), *args.jsonOut);

        return result.found() ? kExitSolved : kExitNoSolution;
    } catch (const MazeError& e) {
        spdlog::error("{}", e.what());
        return kExitIo;
    }
}

} // namespace maze::app
