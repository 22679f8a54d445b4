#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <queue>
#include <vector>

#include "gridsearch/search.hpp"

namespace gridsearch {
namespace detail {

using Heuristic = std::function<Cost(const Position&)>;

/**
 * @brief Best-first search over (cost so far + heuristic)
 *
 * Shared by A* and uniform-cost search. A position may be pushed several
 * times while cheaper costs are found; it is finalized the first time it
 * is popped and later copies are skipped.
 */
class CostFrontierSearch {
public:
    CostFrontierSearch(const Position& origin, const Position& destination,
                       MoveCostFn move, const SearchOptions& options, Heuristic heuristic);

    // `label` names the algorithm in log messages.
    Path run(const char* label);

private:
    struct PQItem {
        Position pos;
        Cost priority;
        std::uint64_t seq;
    };

    // Lowest priority first; equal priorities pop in insertion order.
    struct Cmp {
        bool operator()(const PQItem& a, const PQItem& b) const {
            if (a.priority != b.priority) return a.priority > b.priority;
            return a.seq > b.seq;
        }
    };

    using PQ = std::priority_queue<PQItem, std::vector<PQItem>, Cmp>;

    Cost costOf(const Position& pos) const;
    void push(const Position& pos, Cost cost);

    Position origin_;
    Position destination_;
    MoveCostFn move_;
    const std::vector<Direction>& directions_;
    Heuristic heuristic_;

    std::unique_ptr<KeyedStore<Cost>> cost_;
    std::unique_ptr<KeyedStore<Direction>> came_from_;
    std::unique_ptr<PositionSet> finalized_;
    PQ frontier_;
    std::uint64_t seq_{0};
};

} // namespace detail
} // namespace gridsearch
