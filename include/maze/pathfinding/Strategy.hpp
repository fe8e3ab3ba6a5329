#pragma once
#include "Frontier.hpp"
#include <cstdint>
#include <memory>
#include <string_view>

namespace maze::pf {

enum class Strategy : std::uint8_t {
    Uninformed, // breadth-first, FifoFrontier
    Heuristic,  // A* with Manhattan distance, PriorityFrontier
};

// "bfs" / "astar"
[[nodiscard]] std::string_view strategy_name(Strategy s) noexcept;

// Accepts "bfs", "queue" and "astar" (case-insensitive). Throws maze::ConfigError otherwise.
[[nodiscard]] Strategy parse_strategy(std::string_view name);

// Throws maze::ConfigError for a selector outside the enumeration.
[[nodiscard]] std::unique_ptr<Frontier> make_frontier(Strategy s);

} // namespace maze::pf
