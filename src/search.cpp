#include "gridsearch/search.hpp"
#include "gridsearch/error.hpp"

#include <algorithm>

namespace gridsearch {

std::unique_ptr<PositionSet> makePositionSet(const GridConfig& config, StorageKind kind) {
    if (kind == StorageKind::Sparse) {
        return std::make_unique<SparseSet>();
    }
    return std::make_unique<BitsetMap>(config);
}

MoveFn boundedMove() {
    return [](const Position& p, Direction d) { return p + d; };
}

Path reconstructPath(const KeyedStore<Direction>& came_from,
                     const Position& origin, const Position& destination) {
    if (origin.config() != destination.config()) {
        throw Error(ErrorCode::OutOfBounds, "origin and destination belong to different grids");
    }
    Path path;
    if (origin == destination) {
        return path;
    }
    if (!came_from.get(destination)) {
        throw Error(ErrorCode::Unreachable, toString(destination));
    }

    Position pos = destination;
    std::size_t remaining = origin.config().size() + 1;
    while (pos != origin) {
        auto dir = came_from.get(pos);
        if (!dir) {
            throw Error(ErrorCode::InvalidMovement, "no came-from entry at " + toString(pos));
        }
        path.push_back(*dir);
        auto prev = pos + inverse(*dir);
        if (!prev) {
            throw Error(ErrorCode::InvalidMovement,
                        toString(pos) + " entered from outside the grid");
        }
        pos = *prev;
        if (--remaining == 0) {
            throw Error(ErrorCode::Loop);
        }
    }
    std::reverse(path.begin(), path.end());
    return path;
}

Position applyPath(const Position& origin, const Path& path) {
    Position pos = origin;
    for (Direction d : path) {
        auto next = pos + d;
        if (!next) {
            throw Error(ErrorCode::InvalidMovement,
                        toString(pos) + " + " + directionName(d));
        }
        pos = *next;
    }
    return pos;
}

} // namespace gridsearch
