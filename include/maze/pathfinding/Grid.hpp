#pragma once
#include "GridTypes.hpp"
#include <array>
#include <cstddef>
#include <vector>

namespace maze::pf {

struct Neighbor {
    Action action{};
    Cell cell{};
};

// Up to four neighbors, kept inline so expansion does not allocate.
class Neighbors {
public:
    void push(Neighbor n) noexcept { _items[_count++] = n; }
    [[nodiscard]] std::size_t size() const noexcept { return _count; }
    [[nodiscard]] bool empty() const noexcept { return _count == 0; }
    [[nodiscard]] const Neighbor& operator[](std::size_t i) const noexcept { return _items[i]; }
    [[nodiscard]] const Neighbor* begin() const noexcept { return _items.data(); }
    [[nodiscard]] const Neighbor* end() const noexcept { return _items.data() + _count; }

private:
    std::array<Neighbor, 4> _items{};
    std::size_t _count = 0;
};

// Immutable 4-connected maze. Walls are stored row-major, 1 = wall, 0 = open.
// Throws maze::MazeError if the description is inconsistent.
class Grid {
public:
    Grid(int height, int width, std::vector<std::uint8_t> walls, Cell start, Cell goal);

    [[nodiscard]] int height() const noexcept { return _h; }
    [[nodiscard]] int width()  const noexcept { return _w; }
    [[nodiscard]] Cell start() const noexcept { return _start; }
    [[nodiscard]] Cell goal()  const noexcept { return _goal; }

    [[nodiscard]] bool contains(Cell c) const noexcept {
        return c.row >= 0 && c.col >= 0 && c.row < _h && c.col < _w;
    }

    // Out-of-bounds cells are reported as walls.
    [[nodiscard]] bool is_wall(Cell c) const noexcept {
        return !contains(c) || _walls[index(c)] != 0;
    }

    // In-bounds open neighbors in the order up, down, left, right.
    [[nodiscard]] Neighbors neighbors(Cell c) const noexcept;

    [[nodiscard]] std::size_t cell_count() const noexcept { return _walls.size(); }

    // Row-major index; c must be in bounds.
    [[nodiscard]] std::size_t index(Cell c) const noexcept {
        return static_cast<std::size_t>(c.row) * static_cast<std::size_t>(_w) + static_cast<std::size_t>(c.col);
    }

private:

    int _h = 0, _w = 0;
    std::vector<std::uint8_t> _walls;
    Cell _start{}, _goal{};
};

} // namespace maze::pf
