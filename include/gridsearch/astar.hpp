#pragma once

#include "gridsearch/search.hpp"

namespace gridsearch {

/**
 * @brief A* shortest path where every move costs 1
 *
 * The heuristic is the Chebyshev distance with diagonals enabled and
 * the Manhattan distance without, both admissible for unit moves. Ties
 * in f = g + h pop in insertion order, so results are reproducible.
 *
 * @throws Error Unreachable if the destination cannot be reached.
 */
Path astarSearch(MoveFn move, const Position& origin, const Position& destination,
                 SearchOptions options = {});

/**
 * @brief A* with per-move costs
 *
 * The heuristic assumes every move costs at least 1; cheaper moves can
 * make it overestimate and the returned path may then be suboptimal.
 *
 * @throws Error InvalidCost on a negative move cost, Unreachable if the
 *         destination cannot be reached.
 */
Path astarSearch(MoveCostFn move, const Position& origin, const Position& destination,
                 SearchOptions options = {});

// Admissible estimate used by astarSearch.
Cost astarHeuristic(const Position& from, const Position& to, bool diagonals);

} // namespace gridsearch
