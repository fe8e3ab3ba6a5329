#include "maze/pathfinding/Search.hpp"
#include "maze/pathfinding/Heuristic.hpp"

#include <algorithm>

#include <spdlog/spdlog.h>

namespace maze::pf {

std::string_view status_name(SearchStatus s) noexcept {
    switch (s) {
    case SearchStatus::Searching:       return "searching";
    case SearchStatus::Found:           return "found";
    case SearchStatus::NoSolution:      return "no_solution";
    case SearchStatus::BudgetExhausted: return "budget_exhausted";
    }
    return "unknown";
}

const Solution& SearchResult::require_solution() const {
    if (!solution)
        throw NoSolutionError();
    return *solution;
}

Search::Search(const Grid& grid, Strategy strategy)
    : _g(grid), _strategy(strategy), _frontier(make_frontier(strategy)), _closed(grid.cell_count(), 0)
{
    SearchNode root;
    root.state = _g.start();
    root.cost = 0;
    _frontier->insert(root, priority_of(root));
}

std::optional<int> Search::priority_of(const SearchNode& n) const {
    if (_strategy == Strategy::Heuristic)
        return n.cost + manhattan(n.state, _g.goal());
    return std::nullopt;
}

bool Search::is_explored(Cell c) const noexcept {
    return _g.contains(c) && _closed[_g.index(c)] != 0;
}

SearchStatus Search::step() {
    if (done())
        return _status;

    if (_frontier->empty()) {
        _status = SearchStatus::NoSolution;
        return _status;
    }

    const NodeId id = static_cast<NodeId>(_arena.size());
    _arena.push_back(_frontier->remove_next());
    const Cell cur = _arena[id].state;

    _closed[_g.index(cur)] = 1;
    _explored_order.push_back(cur);
    spdlog::trace("expand #{} ({}, {}) g={}", _explored_order.size(), cur.row, cur.col, _arena[id].cost);

    if (cur == _g.goal()) {
        _goal_node = id;
        _status = SearchStatus::Found;
        return _status;
    }

    expand(id);
    return _status;
}

void Search::expand(NodeId id) {
    const Cell cur = _arena[id].state;
    const int cost = _arena[id].cost;
    for (const Neighbor& n : _g.neighbors(cur)) {
        if (_closed[_g.index(n.cell)] != 0 || _frontier->contains_state(n.cell))
            continue;
        SearchNode child;
        child.state = n.cell;
        child.parent = id;
        child.action = n.action;
        child.cost = cost + 1;
        _frontier->insert(child, priority_of(child));
    }
}

SearchStatus Search::run(std::size_t max_expansions) {
    std::size_t steps = 0;
    while (!done()) {
        if (max_expansions != 0 && steps >= max_expansions)
            break;
        // An empty frontier resolves to NoSolution without expanding anything.
        if (!_frontier->empty())
            ++steps;
        step();
    }
    return _status;
}

Solution Search::reconstruct(NodeId goal) const {
    Solution out;
    NodeId cur = goal;
    while (_arena[cur].parent != kNoParent) {
        out.actions.push_back(*_arena[cur].action);
        out.cells.push_back(_arena[cur].state);
        cur = _arena[cur].parent;
    }
    std::reverse(out.actions.begin(), out.actions.end());
    std::reverse(out.cells.begin(), out.cells.end());
    return out;
}

SearchResult Search::result() const {
    SearchResult r;
    r.strategy = _strategy;
    r.status = done() ? _status : SearchStatus::BudgetExhausted;
    r.explored_count = _explored_order.size();
    r.explored_order = _explored_order;
    if (_status == SearchStatus::Found)
        r.solution = reconstruct(_goal_node);
    return r;
}

SearchResult solve(const Grid& grid, Strategy strategy, const SolveOptions& opt) {
    spdlog::debug("solve: strategy={} grid={}x{} start=({}, {}) goal=({}, {})",
                  strategy_name(strategy), grid.height(), grid.width(),
                  grid.start().row, grid.start().col, grid.goal().row, grid.goal().col);

    Search search(grid, strategy);
    search.run(opt.max_expansions);
    SearchResult r = search.result();

    if (r.status == SearchStatus::BudgetExhausted) {
        spdlog::warn("solve: stopped after {} expansions (limit {})", r.explored_count, opt.max_expansions);
    } else {
        spdlog::debug("solve: {} after {} expansions, path length {}",
                      status_name(r.status), r.explored_count, r.solution ? r.solution->length() : 0u);
    }
    return r;
}

} // namespace maze::pf
