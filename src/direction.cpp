#include "gridsearch/direction.hpp"
#include "gridsearch/error.hpp"

#include <string>

namespace gridsearch {

namespace {

const int kDx[kDirectionCount] = {0, 1, 1, 1, 0, -1, -1, -1};
const int kDy[kDirectionCount] = {-1, -1, 0, 1, 1, 1, 0, -1};

const char* const kNames[kDirectionCount] = {"N", "NE", "E", "SE", "S", "SW", "W", "NW"};
const char kAscii[kDirectionCount] = {'^', '7', '>', '\\', 'v', 'L', '<', '`'};

Direction fromIndex(int index) {
    return static_cast<Direction>(index % kDirectionCount);
}

}

const std::vector<Direction>& directions(bool diagonals) {
    static const std::vector<Direction> all8 = {
        Direction::N, Direction::NE, Direction::E, Direction::SE,
        Direction::S, Direction::SW, Direction::W, Direction::NW
    };
    static const std::vector<Direction> all4 = {
        Direction::N, Direction::E, Direction::S, Direction::W
    };
    return diagonals ? all8 : all4;
}

Direction inverse(Direction d) {
    return fromIndex(directionIndex(d) + kDirectionCount / 2);
}

Direction rotate(Direction d, Direction by) {
    return fromIndex(directionIndex(d) + directionIndex(by));
}

std::pair<int, int> delta(Direction d) {
    const int i = directionIndex(d);
    if (i < 0 || i >= kDirectionCount) {
        throw Error(ErrorCode::InvalidDirection, "direction index " + std::to_string(i));
    }
    return {kDx[i], kDy[i]};
}

std::optional<Direction> directionFromDelta(int dx, int dy) {
    for (int i = 0; i < kDirectionCount; ++i) {
        if (kDx[i] == dx && kDy[i] == dy) {
            return fromIndex(i);
        }
    }
    return std::nullopt;
}

const char* directionName(Direction d) {
    return kNames[directionIndex(d) % kDirectionCount];
}

char directionAscii(Direction d) {
    return kAscii[directionIndex(d) % kDirectionCount];
}

} // namespace gridsearch
