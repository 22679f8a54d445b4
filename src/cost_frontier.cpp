#include "cost_frontier.hpp"
#include "gridsearch/error.hpp"
#include "gridsearch/logging.hpp"

#include <limits>
#include <string>
#include <utility>

namespace gridsearch {
namespace detail {

namespace {

constexpr Cost kInfinity = std::numeric_limits<Cost>::max();

}

CostFrontierSearch::CostFrontierSearch(const Position& origin, const Position& destination,
                                       MoveCostFn move, const SearchOptions& options,
                                       Heuristic heuristic)
: origin_(origin),
  destination_(destination),
  move_(std::move(move)),
  directions_(directions(options.diagonals)),
  heuristic_(std::move(heuristic))
{
    if (origin.config() != destination.config()) {
        throw Error(ErrorCode::OutOfBounds, "origin and destination belong to different grids");
    }
    const GridConfig config = origin.config();
    cost_ = makeKeyedStore<Cost>(config, options.storage, kInfinity);
    came_from_ = makeKeyedStore<Direction>(config, options.storage, Direction::N);
    finalized_ = makePositionSet(config, options.storage);
}

Cost CostFrontierSearch::costOf(const Position& pos) const {
    auto c = cost_->get(pos);
    return c ? *c : kInfinity;
}

void CostFrontierSearch::push(const Position& pos, Cost cost) {
    const Cost estimate = heuristic_(pos);
    if (estimate > kInfinity - cost) {
        throw Error(ErrorCode::InvalidCost, "priority overflows at " + toString(pos));
    }
    frontier_.push(PQItem{pos, cost + estimate, seq_++});
}

Path CostFrontierSearch::run(const char* label) {
    cost_->set(origin_, 0);
    push(origin_, 0);
    std::size_t expanded = 0;

    while (!frontier_.empty()) {
        PQItem item = frontier_.top();
        frontier_.pop();

        if (finalized_->contains(item.pos)) {
            continue;
        }
        finalized_->insert(item.pos);

        if (item.pos == destination_) {
            RCLCPP_DEBUG(logger(), "%s reached %s at cost %lld after expanding %zu positions",
                         label, toString(destination_).c_str(),
                         static_cast<long long>(costOf(destination_)), expanded);
            return reconstructPath(*came_from_, origin_, destination_);
        }
        ++expanded;

        const Cost base = costOf(item.pos);
        for (Direction dir : directions_) {
            auto edge = move_(item.pos, dir);
            if (!edge) {
                continue;
            }
            const Position& next = edge->first;
            const Cost step = edge->second;
            if (step < 0) {
                throw Error(ErrorCode::InvalidCost,
                            std::to_string(step) + " moving " + directionName(dir) +
                            " from " + toString(item.pos));
            }
            if (finalized_->contains(next)) {
                continue;
            }
            if (step > kInfinity - base) {
                throw Error(ErrorCode::InvalidCost,
                            "path cost overflows moving " + std::string(directionName(dir)) +
                            " from " + toString(item.pos));
            }
            const Cost tentative = base + step;
            if (tentative < costOf(next)) {
                cost_->set(next, tentative);
                came_from_->set(next, dir);
                push(next, tentative);
            }
        }
    }

    RCLCPP_DEBUG(logger(), "%s: %s unreachable from %s after expanding %zu positions",
                 label, toString(destination_).c_str(), toString(origin_).c_str(), expanded);
    throw Error(ErrorCode::Unreachable,
                toString(destination_) + " from " + toString(origin_));
}

} // namespace detail
} // namespace gridsearch
