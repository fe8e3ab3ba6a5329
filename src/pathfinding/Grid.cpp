#include "maze/pathfinding/Grid.hpp"
#include "maze/Errors.hpp"

#include <string>
#include <utility>

namespace maze::pf {

namespace {

std::string describe(Cell c) {
    return "(" + std::to_string(c.row) + ", " + std::to_string(c.col) + ")";
}

} // namespace

Grid::Grid(int height, int width, std::vector<std::uint8_t> walls, Cell start, Cell goal)
    : _h(height), _w(width), _walls(std::move(walls)), _start(start), _goal(goal)
{
    if (_h <= 0 || _w <= 0)
        throw MazeError("grid dimensions must be positive, got " + std::to_string(_h) + "x" + std::to_string(_w));

    const std::size_t expected = static_cast<std::size_t>(_h) * static_cast<std::size_t>(_w);
    if (_walls.size() != expected)
        throw MazeError("wall table has " + std::to_string(_walls.size()) + " cells, expected " + std::to_string(expected));

    if (!contains(_start))
        throw MazeError("start " + describe(_start) + " is outside the grid");
    if (!contains(_goal))
        throw MazeError("goal " + describe(_goal) + " is outside the grid");
    if (_start == _goal)
        throw MazeError("start and goal must be distinct cells");
    if (is_wall(_start))
        throw MazeError("start " + describe(_start) + " is a wall");
    if (is_wall(_goal))
        throw MazeError("goal " + describe(_goal) + " is a wall");
}

Neighbors Grid::neighbors(Cell c) const noexcept {
    Neighbors out;
    for (const Action a : kActionOrder) {
        const Cell n = step(c, a);
        if (!is_wall(n))
            out.push({ a, n });
    }
    return out;
}

} // namespace maze::pf
