// tests/test_maze_text.cpp
//
// Text maze parsing, file loading and text rendering.

#include <doctest/doctest.h>

#include "maze/Errors.hpp"
#include "maze/io/MazeText.hpp"
#include "test_support/TempDir.h"

#include <fstream>
#include <string>

using maze::pf::Cell;

TEST_CASE("MazeText/ParsesMarkersAndWalls")
{
    const auto g = maze::io::parse_maze("#A#\n# x\nB  ");

    CHECK(g.height() == 3);
    CHECK(g.width() == 3);
    CHECK(g.start() == Cell{0, 1});
    CHECK(g.goal() == Cell{2, 0});
    CHECK(g.is_wall({0, 0}));
    CHECK(g.is_wall({1, 2})); // any other character is a wall
    CHECK_FALSE(g.is_wall({1, 1}));
    CHECK_FALSE(g.is_wall({2, 2}));
}

TEST_CASE("MazeText/PadsShortRowsWithOpenCells")
{
    const auto g = maze::io::parse_maze("A\n####\n  B");
    CHECK(g.width() == 4);
    CHECK_FALSE(g.is_wall({0, 3}));
    CHECK_FALSE(g.is_wall({2, 3}));
    CHECK(g.is_wall({1, 3}));
}

TEST_CASE("MazeText/HandlesCrLfAndTrailingNewline")
{
    const auto g = maze::io::parse_maze("A #\r\n  B\r\n");
    CHECK(g.height() == 2);
    CHECK(g.width() == 3);
    CHECK(g.goal() == Cell{1, 2});
}

TEST_CASE("MazeText/SplitsOnLoneCarriageReturnAndFormFeeds")
{
    // Classic Mac line endings: a lone \r ends the row instead of becoming a wall.
    const auto mac = maze::io::parse_maze("A #\r   \r  B\r");
    CHECK(mac.height() == 3);
    CHECK(mac.width() == 3);
    CHECK_FALSE(mac.is_wall({1, 0}));
    CHECK(mac.goal() == Cell{2, 2});

    const auto mixed = maze::io::parse_maze("A\v \f B\r\n\r");
    CHECK(mixed.height() == 4);
    CHECK(mixed.width() == 2);
    CHECK(mixed.goal() == Cell{2, 1});
    CHECK_FALSE(mixed.is_wall({3, 0})); // empty row from the trailing "\r\n\r"

    // Consecutive breaks keep the empty row between them.
    const auto gap = maze::io::parse_maze("A\r\rB");
    CHECK(gap.height() == 3);
    CHECK(gap.goal() == Cell{2, 0});
}

TEST_CASE("MazeText/RequiresExactlyOneStartAndGoal")
{
    CHECK_THROWS_WITH_AS((void)maze::io::parse_maze("   \n  B"),
                         "maze must have exactly one start point", maze::MazeError);
    CHECK_THROWS_WITH_AS((void)maze::io::parse_maze("A A\n  B"),
                         "maze must have exactly one start point", maze::MazeError);
    CHECK_THROWS_WITH_AS((void)maze::io::parse_maze("A  \n   "),
                         "maze must have exactly one goal", maze::MazeError);
    CHECK_THROWS_WITH_AS((void)maze::io::parse_maze("AB B"),
                         "maze must have exactly one goal", maze::MazeError);
    CHECK_THROWS_AS((void)maze::io::parse_maze(""), maze::MazeError);
}

TEST_CASE("MazeText/LoadsFromFile")
{
    maze_test::TempDir dir("maze_text");
    const auto file = dir.path() / "maze.txt";
    {
        std::ofstream out(file, std::ios::binary);
        out << "##### \n#A  #\n#  B#\n#####\n";
    }

    const auto g = maze::io::load_maze_file(file);
    CHECK(g.height() == 4);
    CHECK(g.width() == 6);
    CHECK(g.start() == Cell{1, 1});
    CHECK(g.goal() == Cell{2, 3});

    CHECK_THROWS_AS((void)maze::io::load_maze_file(dir.path() / "missing.txt"), maze::MazeError);
}

TEST_CASE("MazeText/RenderBareMaze")
{
    const auto g = maze::io::parse_maze("A #\n# B");
    CHECK(maze::io::render_text(g) == "\nA \xE2\x96\x88\n\xE2\x96\x88 B\n\n");
}

TEST_CASE("MazeText/RenderSolutionAndExplored")
{
    const auto g = maze::io::parse_maze("A  \n   \n  B");
    const auto r = maze::pf::solve(g, maze::pf::Strategy::Uninformed);
    REQUIRE(r.found());

    CHECK(maze::io::render_text(g, &r) == "\nA  \n*  \n**B\n\n");

    maze::io::RenderOptions opt;
    opt.show_explored = true;
    CHECK(maze::io::render_text(g, &r, opt) == "\nA..\n*..\n**B\n\n");

    opt.show_solution = false;
    CHECK(maze::io::render_text(g, &r, opt) == "\nA..\n...\n..B\n\n");
}
