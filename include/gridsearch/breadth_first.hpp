#pragma once

#include <cstddef>
#include <deque>
#include <iterator>
#include <memory>
#include <optional>
#include <vector>

#include "gridsearch/search.hpp"

namespace gridsearch {

struct BreadthFirstStep {
    Position position;
    // Direction of the move that first reached `position`.
    Direction direction;
};

/**
 * @brief Lazy breadth-first traversal from one or more origins
 *
 * Every call to next() does only the work needed to produce one more
 * step. Each reachable position is produced exactly once, in
 * non-decreasing distance from the nearest origin; the origins
 * themselves are not produced. Queue and visited set belong to the
 * iterator, so dropping it early is always safe.
 */
class BreadthFirstIterator {
public:
    class iterator {
    public:
        using iterator_category = std::input_iterator_tag;
        using value_type = BreadthFirstStep;
        using difference_type = std::ptrdiff_t;
        using pointer = const BreadthFirstStep*;
        using reference = const BreadthFirstStep&;

        iterator() : owner_(nullptr) {}
        explicit iterator(BreadthFirstIterator* owner) : owner_(owner) { advance(); }

        reference operator*() const { return *current_; }
        pointer operator->() const { return &*current_; }
        iterator& operator++() { advance(); return *this; }
        bool operator==(const iterator& o) const { return !current_ && !o.current_; }
        bool operator!=(const iterator& o) const { return !(*this == o); }

    private:
        void advance() {
            if (owner_) current_ = owner_->next();
        }

        BreadthFirstIterator* owner_;
        std::optional<BreadthFirstStep> current_;
    };

    BreadthFirstIterator(const Position& origin, MoveFn move, SearchOptions options = {});
    BreadthFirstIterator(const std::vector<Position>& origins, MoveFn move, SearchOptions options = {});

    std::optional<BreadthFirstStep> next();

    iterator begin() { return iterator(this); }
    iterator end() { return iterator(); }

private:
    MoveFn move_;
    const std::vector<Direction>& directions_;
    std::unique_ptr<PositionSet> visited_;
    std::deque<Position> frontier_;

    // Position being expanded and the next direction to try from it.
    std::optional<Position> current_;
    std::size_t next_dir_{0};
};

struct BreadthFirstResult {
    Position goal;
    Path path;
};

/**
 * @brief Shortest hop-count path to the first position accepted by `goal`
 *
 * @throws Error Unreachable when every reachable position was rejected.
 */
BreadthFirstResult breadthFirstSearch(const Position& origin, MoveFn move, GoalFn goal,
                                      SearchOptions options = {});

} // namespace gridsearch
