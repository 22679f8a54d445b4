#pragma once

#include <cstdint>
#include <optional>
#include <utility>
#include <vector>

namespace gridsearch {

/**
 * @brief One of the 8 unit moves between adjacent grid cells
 *
 * Values are ordered clockwise starting at north; y grows downward, so
 * N is (0, -1) and S is (0, 1). The 4-way subset is {N, E, S, W}.
 */
enum class Direction : std::uint8_t {
    N = 0,
    NE,
    E,
    SE,
    S,
    SW,
    W,
    NW
};

constexpr int kDirectionCount = 8;

inline int directionIndex(Direction d) { return static_cast<int>(d); }

// Directions of the 4-way (diagonals == false) or 8-way set, in index order.
const std::vector<Direction>& directions(bool diagonals);

inline bool isDiagonal(Direction d) { return directionIndex(d) % 2 == 1; }

// 180 degree rotation.
Direction inverse(Direction d);

// Clockwise rotation by the index of `by` (N is identity, E is 90 degrees).
Direction rotate(Direction d, Direction by);

// Unit offset (dx, dy); throws Error InvalidDirection for a value outside the enum.
std::pair<int, int> delta(Direction d);

std::optional<Direction> directionFromDelta(int dx, int dy);

const char* directionName(Direction d);
char directionAscii(Direction d);

} // namespace gridsearch
