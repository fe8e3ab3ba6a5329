#include "maze/pathfinding/Frontier.hpp"

namespace maze::pf {

bool FifoFrontier::insert(const SearchNode& node, std::optional<int>) {
    if (!_states.insert(node.state).second)
        return false;
    _queue.push_back(node);
    return true;
}

SearchNode FifoFrontier::remove_next() {
    if (_queue.empty())
        throw EmptyFrontierError();
    SearchNode node = _queue.front();
    _queue.pop_front();
    _states.erase(node.state);
    return node;
}

bool PriorityFrontier::insert(const SearchNode& node, std::optional<int> priority) {
    if (!_states.insert(node.state).second)
        return false;
    _heap.push({ priority.value_or(node.cost), _counter++, node });
    return true;
}

SearchNode PriorityFrontier::remove_next() {
    if (_heap.empty())
        throw EmptyFrontierError();
    SearchNode node = _heap.top().node;
    _heap.pop();
    _states.erase(node.state);
    return node;
}

} // namespace maze::pf
