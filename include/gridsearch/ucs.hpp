#pragma once

#include "gridsearch/search.hpp"

namespace gridsearch {

/**
 * @brief Lowest total cost path (Dijkstra) from origin to destination
 *
 * Move costs must be non-negative; zero is accepted as is.
 *
 * @throws Error InvalidCost on a negative move cost, Unreachable if the
 *         destination cannot be reached.
 */
Path uniformCostSearch(MoveCostFn move, const Position& origin, const Position& destination,
                       SearchOptions options = {});

} // namespace gridsearch
