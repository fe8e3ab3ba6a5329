// tests/test_grid.cpp
//
// Grid construction checks and neighbor ordering.

#include <doctest/doctest.h>

#include "maze/Errors.hpp"
#include "maze/pathfinding/Grid.hpp"
#include "maze/pathfinding/Heuristic.hpp"

#include <cstdint>
#include <vector>

using maze::pf::Action;
using maze::pf::Cell;
using maze::pf::Grid;

namespace {

std::vector<std::uint8_t> open_cells(int h, int w)
{
    return std::vector<std::uint8_t>(static_cast<std::size_t>(h * w), 0);
}

} // namespace

TEST_CASE("Grid/NeighborsInFixedOrder")
{
    const Grid g(3, 3, open_cells(3, 3), {0, 0}, {2, 2});
    const auto n = g.neighbors({1, 1});

    REQUIRE(n.size() == 4u);
    CHECK(n[0].action == Action::Up);
    CHECK(n[0].cell == Cell{0, 1});
    CHECK(n[1].action == Action::Down);
    CHECK(n[1].cell == Cell{2, 1});
    CHECK(n[2].action == Action::Left);
    CHECK(n[2].cell == Cell{1, 0});
    CHECK(n[3].action == Action::Right);
    CHECK(n[3].cell == Cell{1, 2});
}

TEST_CASE("Grid/NeighborsSkipBoundsAndWalls")
{
    auto walls = open_cells(2, 3);
    walls[1] = 1; // (0,1)
    const Grid g(2, 3, walls, {0, 0}, {1, 2});

    const auto corner = g.neighbors({0, 0});
    REQUIRE(corner.size() == 1u);
    CHECK(corner[0].action == Action::Down);
    CHECK(corner[0].cell == Cell{1, 0});

    CHECK(g.is_wall({0, 1}));
    CHECK(g.is_wall({-1, 0}));
    CHECK(g.is_wall({0, 3}));
    CHECK_FALSE(g.is_wall({1, 1}));
}

TEST_CASE("Grid/RejectsInconsistentDescriptions")
{
    CHECK_THROWS_AS(Grid(0, 3, {}, {0, 0}, {0, 1}), maze::MazeError);
    CHECK_THROWS_AS(Grid(2, 2, open_cells(2, 3), {0, 0}, {1, 1}), maze::MazeError);
    CHECK_THROWS_AS(Grid(2, 2, open_cells(2, 2), {0, 0}, {0, 0}), maze::MazeError);
    CHECK_THROWS_AS(Grid(2, 2, open_cells(2, 2), {0, 0}, {2, 0}), maze::MazeError);
    CHECK_THROWS_AS(Grid(2, 2, open_cells(2, 2), {-1, 0}, {1, 1}), maze::MazeError);

    auto walls = open_cells(2, 2);
    walls[3] = 1;
    CHECK_THROWS_AS(Grid(2, 2, walls, {0, 0}, {1, 1}), maze::MazeError);
}

TEST_CASE("Grid/StepAndManhattan")
{
    CHECK(maze::pf::step({3, 3}, Action::Up) == Cell{2, 3});
    CHECK(maze::pf::step({3, 3}, Action::Down) == Cell{4, 3});
    CHECK(maze::pf::step({3, 3}, Action::Left) == Cell{3, 2});
    CHECK(maze::pf::step({3, 3}, Action::Right) == Cell{3, 4});

    CHECK(maze::pf::manhattan({0, 0}, {2, 2}) == 4);
    CHECK(maze::pf::manhattan({5, 1}, {2, 3}) == 5);
    CHECK(maze::pf::manhattan({4, 4}, {4, 4}) == 0);

    CHECK(maze::pf::action_name(Action::Left) == "left");
}

TEST_CASE("Grid/CellHashIsStructural")
{
    const maze::pf::CellHash h;
    CHECK(h(Cell{7, 9}) == h(Cell{7, 9}));
    CHECK(h(Cell{7, 9}) != h(Cell{9, 7}));
}
