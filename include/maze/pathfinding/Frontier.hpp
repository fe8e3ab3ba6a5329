#pragma once
#include "SearchNode.hpp"
#include <cstddef>
#include <cstdint>
#include <deque>
#include <optional>
#include <queue>
#include <stdexcept>
#include <unordered_set>
#include <vector>

namespace maze::pf {

// remove_next() on an empty frontier. Callers are expected to check empty() first.
class EmptyFrontierError : public std::logic_error {
public:
    EmptyFrontierError() : std::logic_error("empty frontier") {}
};

// Open set of discovered-but-unexpanded nodes.
// A state is resident at most once: the first insert wins and later inserts of the
// same state are dropped, even if they carry a lower cost. There is no decrease-key.
class Frontier {
public:
    virtual ~Frontier() = default;

    // Returns false (and does nothing) if node.state is already resident.
    virtual bool insert(const SearchNode& node, std::optional<int> priority = std::nullopt) = 0;

    // Throws EmptyFrontierError when empty.
    virtual SearchNode remove_next() = 0;

    [[nodiscard]] bool empty() const noexcept { return _states.empty(); }
    [[nodiscard]] std::size_t size() const noexcept { return _states.size(); }
    [[nodiscard]] bool contains_state(const Cell& c) const { return _states.count(c) != 0; }

protected:
    std::unordered_set<Cell, CellHash> _states;
};

// Breadth-first: oldest insert first, priorities ignored.
class FifoFrontier final : public Frontier {
public:
    bool insert(const SearchNode& node, std::optional<int> priority = std::nullopt) override;
    SearchNode remove_next() override;

private:
    std::deque<SearchNode> _queue;
};

// A*: smallest priority first, ties by insertion order. Without a priority the node's
// cost is used, which makes the frontier behave like uniform-cost search.
class PriorityFrontier final : public Frontier {
public:
    bool insert(const SearchNode& node, std::optional<int> priority = std::nullopt) override;
    SearchNode remove_next() override;

private:
    struct Entry {
        int priority;
        std::uint64_t order; // monotonic counter for stable tie-breaking
        SearchNode node;
    };
    struct EntryCmp {
        bool operator()(const Entry& a, const Entry& b) const noexcept {
            if (a.priority != b.priority) return a.priority > b.priority; // smaller first
            return a.order > b.order;                                     // FIFO among equals
        }
    };

    std::priority_queue<Entry, std::vector<Entry>, EntryCmp> _heap;
    std::uint64_t _counter = 0;
};

} // namespace maze::pf
