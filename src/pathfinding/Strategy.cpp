#include "maze/pathfinding/Strategy.hpp"
#include "maze/Errors.hpp"

#include <cctype>
#include <string>

namespace maze::pf {

namespace {

bool equals_i(std::string_view a, std::string_view b) noexcept {
    if (a.size() != b.size())
        return false;
    for (std::size_t i = 0; i < a.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(a[i])) != std::tolower(static_cast<unsigned char>(b[i])))
            return false;
    }
    return true;
}

} // namespace

std::string_view strategy_name(Strategy s) noexcept {
    switch (s) {
    case Strategy::Uninformed: return "bfs";
    case Strategy::Heuristic:  return "astar";
    }
    return "unknown";
}

Strategy parse_strategy(std::string_view name) {
    if (equals_i(name, "bfs") || equals_i(name, "queue"))
        return Strategy::Uninformed;
    if (equals_i(name, "astar"))
        return Strategy::Heuristic;
    throw ConfigError("unknown strategy '" + std::string(name) + "': use 'bfs' or 'astar'");
}

std::unique_ptr<Frontier> make_frontier(Strategy s) {
    switch (s) {
    case Strategy::Uninformed: return std::make_unique<FifoFrontier>();
    case Strategy::Heuristic:  return std::make_unique<PriorityFrontier>();
    }
    throw ConfigError("unknown strategy selector " + std::to_string(static_cast<int>(s)));
}

} // namespace maze::pf
