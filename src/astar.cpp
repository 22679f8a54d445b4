#include "gridsearch/astar.hpp"
#include "cost_frontier.hpp"

#include <utility>

namespace gridsearch {

Cost astarHeuristic(const Position& from, const Position& to, bool diagonals) {
    return static_cast<Cost>(diagonals ? chebyshev(from, to) : manhattan(from, to));
}

Path astarSearch(MoveFn move, const Position& origin, const Position& destination,
                 SearchOptions options) {
    MoveCostFn unit = [move = std::move(move)](const Position& p, Direction d)
        -> std::optional<std::pair<Position, Cost>> {
        auto next = move(p, d);
        if (!next) return std::nullopt;
        return std::make_pair(*next, Cost{1});
    };
    return astarSearch(std::move(unit), origin, destination, options);
}

Path astarSearch(MoveCostFn move, const Position& origin, const Position& destination,
                 SearchOptions options) {
    const bool diagonals = options.diagonals;
    detail::CostFrontierSearch search(
        origin, destination, std::move(move), options,
        [destination, diagonals](const Position& p) {
            return astarHeuristic(p, destination, diagonals);
        });
    return search.run("A*");
}

} // namespace gridsearch
