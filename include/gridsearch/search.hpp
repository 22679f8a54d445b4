#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <utility>
#include <vector>

#include "gridsearch/bitset_map.hpp"
#include "gridsearch/dense_map.hpp"
#include "gridsearch/direction.hpp"
#include "gridsearch/position.hpp"
#include "gridsearch/storage.hpp"

namespace gridsearch {

using Cost = std::int64_t;
using Path = std::vector<Direction>;

// Caller-supplied edge evaluation: next position, or empty if the move is blocked.
using MoveFn = std::function<std::optional<Position>(const Position&, Direction)>;
// Same, with the cost of the move. Costs must be non-negative.
using MoveCostFn = std::function<std::optional<std::pair<Position, Cost>>(const Position&, Direction)>;
using GoalFn = std::function<bool(const Position&)>;

enum class StorageKind {
    Dense,
    Sparse
};

struct SearchOptions {
    bool diagonals = false;
    StorageKind storage = StorageKind::Dense;
};

std::unique_ptr<PositionSet> makePositionSet(const GridConfig& config, StorageKind kind);

// Dense stores start with `fill` everywhere; sparse stores start empty.
template<typename V>
std::unique_ptr<KeyedStore<V>> makeKeyedStore(const GridConfig& config, StorageKind kind, const V& fill) {
    if (kind == StorageKind::Sparse) {
        return std::make_unique<SparseMap<V>>();
    }
    return std::make_unique<DenseMap<V>>(config, fill);
}

// Moves to p + d when it stays inside the grid.
MoveFn boundedMove();

/**
 * @brief Rebuild the path to `destination` from a came-from map
 *
 * Each entry holds the direction used to enter that position, so the
 * walk goes backward with the inverse direction until it reaches
 * `origin`. The move function that filled the map must be geometric
 * (a move from p along d lands on p + d).
 *
 * @throws Error Unreachable if the destination has no entry,
 *         InvalidMovement if the walk falls off the map, Loop if it
 *         does not reach the origin within width*height steps.
 */
Path reconstructPath(const KeyedStore<Direction>& came_from,
                     const Position& origin, const Position& destination);

// Replays a path from origin; throws Error InvalidMovement on a step off the grid.
Position applyPath(const Position& origin, const Path& path);

} // namespace gridsearch
