#pragma once
#include "GridTypes.hpp"
#include <optional>
#include <vector>

namespace maze::pf {

// One vertex of the search tree. Parents live in a NodeArena and always precede
// their children, so the tree is acyclic by construction.
struct SearchNode {
    Cell state{};
    NodeId parent = kNoParent;
    std::optional<Action> action; // empty at the root
    int cost = 0;                 // g: steps from start
};

using NodeArena = std::vector<SearchNode>;

} // namespace maze::pf
