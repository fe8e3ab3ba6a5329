#pragma once
#include <array>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <string_view>

namespace maze::pf {

// (row, col); row grows downwards.
struct Cell {
    int row{}, col{};
    constexpr bool operator==(const Cell&) const = default;
};

struct CellHash {
    std::size_t operator()(const Cell& c) const noexcept {
        const std::uint64_t ur = static_cast<std::uint64_t>(static_cast<std::uint32_t>(c.row));
        const std::uint64_t uc = static_cast<std::uint64_t>(static_cast<std::uint32_t>(c.col));
        std::uint64_t k = (ur << 32) | uc;
        // SplitMix64 finalizer
        k += 0x9e3779b97f4a7c15ull;
        k = (k ^ (k >> 30)) * 0xbf58476d1ce4e5b9ull;
        k = (k ^ (k >> 27)) * 0x94d049bb133111ebull;
        k ^= (k >> 31);
        if constexpr (sizeof(std::size_t) < sizeof(std::uint64_t)) {
            return static_cast<std::size_t>(k ^ (k >> 32));
        } else {
            return static_cast<std::size_t>(k);
        }
    }
};

enum class Action : std::uint8_t { Up, Down, Left, Right };

// Expansion order. Changing it changes which of several shortest paths is returned.
inline constexpr std::array<Action, 4> kActionOrder = { Action::Up, Action::Down, Action::Left, Action::Right };

[[nodiscard]] constexpr std::string_view action_name(Action a) noexcept {
    switch (a) {
    case Action::Up:    return "up";
    case Action::Down:  return "down";
    case Action::Left:  return "left";
    case Action::Right: return "right";
    }
    return "?";
}

[[nodiscard]] constexpr Cell step(Cell c, Action a) noexcept {
    switch (a) {
    case Action::Up:    return { c.row - 1, c.col };
    case Action::Down:  return { c.row + 1, c.col };
    case Action::Left:  return { c.row, c.col - 1 };
    case Action::Right: return { c.row, c.col + 1 };
    }
    return c;
}

using NodeId = std::uint32_t;
constexpr NodeId kNoParent = std::numeric_limits<NodeId>::max();

} // namespace maze::pf
