#include "gridsearch/ucs.hpp"
#include "cost_frontier.hpp"

#include <utility>

namespace gridsearch {

Path uniformCostSearch(MoveCostFn move, const Position& origin, const Position& destination,
                       SearchOptions options) {
    detail::CostFrontierSearch search(origin, destination, std::move(move), options,
                                      [](const Position&) { return Cost{0}; });
    return search.run("UCS");
}

} // namespace gridsearch
