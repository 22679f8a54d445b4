#pragma once

#include <string>
#include <vector>

#include "gridsearch/bitset_map.hpp"
#include "gridsearch/dense_map.hpp"
#include "gridsearch/search.hpp"

namespace gridsearch {

/**
 * @brief Text maze: walls, per-cell entry cost, start and goal
 *
 * Cell characters:
 *   '#' wall, '.' open (cost 1), '~' rough (rough_cost),
 *   'S' start, 'G' goal (both cost 1).
 * Without an 'S' the start is the top-left cell; without a 'G' the goal
 * is the bottom-right cell.
 */
struct Maze {
    BitsetMap walls;
    DenseMap<Cost> costs;
    Position start;
    Position goal;

    const GridConfig& config() const { return walls.config(); }

    // The returned functions refer to this maze, which must outlive them.
    MoveFn moveFunction() const;
    MoveCostFn costFunction() const;
};

// Throws Error for empty or ragged input, std::runtime_error for unknown characters.
Maze parseMaze(const std::vector<std::string>& lines, Cost rough_cost = 2);

// Throws std::runtime_error if the file cannot be read.
Maze loadMaze(const std::string& path, Cost rough_cost = 2);

// Sum of the entry costs of every cell the path moves into.
Cost pathCost(const Maze& maze, const Path& path);

// Maze text with the cells a path leaves from marked by the direction taken.
std::vector<std::string> renderPath(const Maze& maze, const Path& path);

} // namespace gridsearch
