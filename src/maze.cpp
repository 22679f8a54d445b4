#include "gridsearch/maze.hpp"
#include "gridsearch/error.hpp"

#include <fstream>
#include <optional>
#include <stdexcept>

namespace gridsearch {

namespace {

constexpr char kWall = '#';
constexpr char kOpen = '.';
constexpr char kRough = '~';
constexpr char kStart = 'S';
constexpr char kGoal = 'G';

}

MoveFn Maze::moveFunction() const {
    return [this](const Position& p, Direction d) -> std::optional<Position> {
        auto next = p + d;
        if (!next || walls.get(*next)) return std::nullopt;
        return next;
    };
}

MoveCostFn Maze::costFunction() const {
    return [this](const Position& p, Direction d) -> std::optional<std::pair<Position, Cost>> {
        auto next = p + d;
        if (!next || walls.get(*next)) return std::nullopt;
        return std::make_pair(*next, costs.at(*next));
    };
}

Maze parseMaze(const std::vector<std::string>& lines, Cost rough_cost) {
    if (lines.empty() || lines.front().empty()) {
        throw Error(ErrorCode::Empty, "maze has no cells");
    }
    if (rough_cost < 0) {
        throw Error(ErrorCode::InvalidCost, "rough cost " + std::to_string(rough_cost));
    }
    const std::size_t width = lines.front().size();
    for (std::size_t y = 0; y < lines.size(); ++y) {
        if (lines[y].size() != width) {
            throw Error(ErrorCode::SizeMismatch,
                        "line " + std::to_string(y) + " has " + std::to_string(lines[y].size()) +
                        " cells, expected " + std::to_string(width));
        }
    }

    const GridConfig config(static_cast<int>(width), static_cast<int>(lines.size()));
    BitsetMap walls(config);
    DenseMap<Cost> costs(config, 1);
    std::optional<Position> start;
    std::optional<Position> goal;

    for (const auto& pos : allPositions(config)) {
        const char c = lines[pos.y()][pos.x()];
        switch (c) {
            case kWall:  walls.setTrue(pos); break;
            case kRough: costs.set(pos, rough_cost); break;
            case kStart: start = pos; break;
            case kGoal:  goal = pos; break;
            case kOpen:  break;
            default:
                throw std::runtime_error(std::string("Unknown maze cell '") + c + "' at " + toString(pos));
        }
    }

    return Maze{walls, costs, start.value_or(config.first()), goal.value_or(config.last())};
}

Maze loadMaze(const std::string& path, Cost rough_cost) {
    std::ifstream in(path);
    if (!in) throw std::runtime_error("Failed to open maze file: " + path);

    std::vector<std::string> lines;
    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line.empty()) continue;
        lines.push_back(line);
    }
    return parseMaze(lines, rough_cost);
}

Cost pathCost(const Maze& maze, const Path& path) {
    Cost total = 0;
    Position pos = maze.start;
    for (Direction d : path) {
        auto next = pos + d;
        if (!next) {
            throw Error(ErrorCode::InvalidMovement, toString(pos) + " + " + directionName(d));
        }
        pos = *next;
        total += maze.costs.at(pos);
    }
    return total;
}

std::vector<std::string> renderPath(const Maze& maze, const Path& path) {
    const GridConfig& config = maze.config();
    std::vector<std::string> out(config.height(), std::string(config.width(), kOpen));
    for (const auto& pos : allPositions(config)) {
        if (maze.walls.get(pos)) {
            out[pos.y()][pos.x()] = kWall;
        } else if (maze.costs.at(pos) != 1) {
            out[pos.y()][pos.x()] = kRough;
        }
    }

    Position pos = maze.start;
    for (Direction d : path) {
        out[pos.y()][pos.x()] = directionAscii(d);
        auto next = pos + d;
        if (!next) {
            throw Error(ErrorCode::InvalidMovement, toString(pos) + " + " + directionName(d));
        }
        pos = *next;
    }
    out[maze.start.y()][maze.start.x()] = kStart;
    out[maze.goal.y()][maze.goal.x()] = kGoal;
    return out;
}

} // namespace gridsearch
