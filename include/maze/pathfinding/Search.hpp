#pragma once
#include "Grid.hpp"
#include "SearchNode.hpp"
#include "Strategy.hpp"
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string_view>
#include <vector>

namespace maze::pf {

enum class SearchStatus : std::uint8_t {
    Searching,       // frontier still has work
    Found,
    NoSolution,      // every reachable cell explored, goal not among them
    BudgetExhausted, // stopped by an expansion limit before finishing
};

[[nodiscard]] std::string_view status_name(SearchStatus s) noexcept;

// Path from start (exclusive) to goal (inclusive). actions[i] moves onto cells[i].
struct Solution {
    std::vector<Action> actions;
    std::vector<Cell> cells;
    [[nodiscard]] std::size_t length() const noexcept { return actions.size(); }
};

class NoSolutionError : public std::runtime_error {
public:
    NoSolutionError() : std::runtime_error("no solution") {}
};

struct SearchResult {
    Strategy strategy = Strategy::Uninformed;
    SearchStatus status = SearchStatus::Searching;
    std::optional<Solution> solution;  // set only when status == Found
    std::size_t explored_count = 0;
    std::vector<Cell> explored_order;  // dequeue order, diagnostics only

    [[nodiscard]] bool found() const noexcept { return status == SearchStatus::Found; }

    // Throws NoSolutionError unless found().
    [[nodiscard]] const Solution& require_solution() const;
};

struct SolveOptions {
    std::size_t max_expansions = 0; // 0 = unlimited
};

// Resumable graph search over a Grid. Each step() dequeues and expands one node, so
// hosts can animate the search or bound its latency without threads.
// The grid must outlive the Search.
class Search {
public:
    Search(const Grid& grid, Strategy strategy);
    Search(Grid&&, Strategy) = delete; // would dangle

    // Expand one node. No-op once the search has reached a terminal status.
    SearchStatus step();

    // Step until terminal, or until max_expansions more nodes were expanded (0 = no limit).
    SearchStatus run(std::size_t max_expansions = 0);

    [[nodiscard]] SearchStatus status() const noexcept { return _status; }
    [[nodiscard]] bool done() const noexcept { return _status != SearchStatus::Searching; }
    [[nodiscard]] Strategy strategy() const noexcept { return _strategy; }

    [[nodiscard]] std::size_t explored_count() const noexcept { return _explored_order.size(); }
    [[nodiscard]] const std::vector<Cell>& explored_order() const noexcept { return _explored_order; }
    [[nodiscard]] bool is_explored(Cell c) const noexcept;
    [[nodiscard]] std::size_t frontier_size() const noexcept { return _frontier->size(); }

    // Snapshot of the current state. An unfinished search reports BudgetExhausted.
    [[nodiscard]] SearchResult result() const;

private:
    [[nodiscard]] std::optional<int> priority_of(const SearchNode& n) const;
    void expand(NodeId id);
    [[nodiscard]] Solution reconstruct(NodeId goal) const;

    const Grid& _g;
    Strategy _strategy;
    std::unique_ptr<Frontier> _frontier;
    NodeArena _arena;                    // expanded nodes, indexed by NodeId
    std::vector<std::uint8_t> _closed;   // per cell, 1 = explored
    std::vector<Cell> _explored_order;
    SearchStatus _status = SearchStatus::Searching;
    NodeId _goal_node = kNoParent;
};

// One-shot solve. Never throws for an unsolvable maze; inspect SearchResult::status.
[[nodiscard]] SearchResult solve(const Grid& grid, Strategy strategy, const SolveOptions& opt = {});

} // namespace maze::pf
