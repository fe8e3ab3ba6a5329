// maze_solve: load a text maze, solve it with BFS or A*, print the solution.
//
// Exit codes: 0 solved, 1 no solution (or expansion budget hit),
//             2 usage/configuration error, 3 maze load or output error.

#include "app/CommandLineArgs.h"
#include "app/MazeSolve.h"
#include "logging/Log.h"

#include <cstdio>
#include <exception>
#include <iostream>

int main(int argc, char** argv)
{
    try {
        maze::logsys::init();
        return maze::app::RunMazeSolve(maze::app::ParseCommandLineArgs(argc, argv), std::cout, std::cerr);
    } catch (const std::exception& e) {
        std::fprintf(stderr, "maze_solve: unhandled exception: %s\n", e.what());
        return maze::app::kExitIo;
    }
}
