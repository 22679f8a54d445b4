#include "gridsearch/breadth_first.hpp"
#include "gridsearch/error.hpp"
#include "gridsearch/logging.hpp"

#include <utility>

namespace gridsearch {

namespace {

std::vector<Position> checkedOrigins(const std::vector<Position>& origins) {
    if (origins.empty()) {
        throw Error(ErrorCode::Empty, "breadth-first traversal needs at least one origin");
    }
    const GridConfig config = origins.front().config();
    for (const auto& origin : origins) {
        if (origin.config() != config) {
            throw Error(ErrorCode::OutOfBounds, "origins belong to different grids");
        }
    }
    return origins;
}

}

BreadthFirstIterator::BreadthFirstIterator(const Position& origin, MoveFn move, SearchOptions options)
: BreadthFirstIterator(std::vector<Position>{origin}, std::move(move), options)
{}

BreadthFirstIterator::BreadthFirstIterator(const std::vector<Position>& origins, MoveFn move,
                                           SearchOptions options)
: move_(std::move(move)),
  directions_(directions(options.diagonals))
{
    const std::vector<Position> seeds = checkedOrigins(origins);
    visited_ = makePositionSet(seeds.front().config(), options.storage);
    for (const auto& origin : seeds) {
        if (!visited_->contains(origin)) {
            visited_->insert(origin);
            frontier_.push_back(origin);
        }
    }
}

std::optional<BreadthFirstStep> BreadthFirstIterator::next() {
    while (true) {
        if (!current_) {
            if (frontier_.empty()) {
                return std::nullopt;
            }
            current_ = frontier_.front();
            frontier_.pop_front();
            next_dir_ = 0;
        }

        while (next_dir_ < directions_.size()) {
            const Direction dir = directions_[next_dir_++];
            auto candidate = move_(*current_, dir);
            if (!candidate || visited_->contains(*candidate)) {
                continue;
            }
            visited_->insert(*candidate);
            frontier_.push_back(*candidate);
            return BreadthFirstStep{*candidate, dir};
        }
        current_.reset();
    }
}

BreadthFirstResult breadthFirstSearch(const Position& origin, MoveFn move, GoalFn goal,
                                      SearchOptions options) {
    if (goal(origin)) {
        return BreadthFirstResult{origin, Path{}};
    }

    auto came_from = makeKeyedStore<Direction>(origin.config(), options.storage, Direction::N);
    BreadthFirstIterator traversal(origin, std::move(move), options);
    std::size_t visited = 0;

    while (auto step = traversal.next()) {
        ++visited;
        came_from->set(step->position, step->direction);
        if (goal(step->position)) {
            RCLCPP_DEBUG(logger(), "BFS reached %s after visiting %zu positions",
                         toString(step->position).c_str(), visited);
            return BreadthFirstResult{step->position,
                                      reconstructPath(*came_from, origin, step->position)};
        }
    }

    RCLCPP_DEBUG(logger(), "BFS from %s exhausted %zu positions without a goal",
                 toString(origin).c_str(), visited);
    throw Error(ErrorCode::Unreachable, "no goal reachable from " + toString(origin));
}

} // namespace gridsearch
