#pragma once
#include "GridTypes.hpp"
#include <cstdlib>

namespace maze::pf {

// Manhattan distance: admissible and consistent for 4-connected grids with unit step cost.
[[nodiscard]] inline int manhattan(const Cell& a, const Cell& b) noexcept {
    return std::abs(a.row - b.row) + std::abs(a.col - b.col);
}

} // namespace maze::pf
