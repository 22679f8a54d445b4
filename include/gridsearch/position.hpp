#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <iterator>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "gridsearch/direction.hpp"

namespace gridsearch {

class Position;

/**
 * @brief Immutable width/height of a rectangular grid
 *
 * Both dimensions must be in [1, 65535]; anything else throws Error.
 */
class GridConfig {
public:
    GridConfig(int width, int height);

    std::uint16_t width() const noexcept { return width_; }
    std::uint16_t height() const noexcept { return height_; }
    std::size_t size() const noexcept {
        return static_cast<std::size_t>(width_) * static_cast<std::size_t>(height_);
    }

    bool contains(int x, int y) const noexcept {
        return x >= 0 && y >= 0 && x < width_ && y < height_;
    }

    Position first() const;
    Position last() const;
    Position center() const;

    bool operator==(const GridConfig& o) const noexcept {
        return width_ == o.width_ && height_ == o.height_;
    }
    bool operator!=(const GridConfig& o) const noexcept { return !(*this == o); }

private:
    std::uint16_t width_;
    std::uint16_t height_;
};

/**
 * @brief A coordinate that is always inside its grid
 *
 * Positions can only be obtained through the checked factories, so any
 * Position value in hand is valid for the GridConfig it carries.
 */
class Position {
public:
    static Position create(const GridConfig& config, int x, int y);
    static std::optional<Position> tryCreate(const GridConfig& config, int x, int y);
    static Position fromIndex(const GridConfig& config, std::size_t index);

    int x() const noexcept { return x_; }
    int y() const noexcept { return y_; }
    std::pair<int, int> xy() const { return {x_, y_}; }
    GridConfig config() const { return GridConfig(width_, height_); }

    // Row-major linear index: y * width + x.
    std::size_t index() const noexcept {
        return static_cast<std::size_t>(y_) * width_ + x_;
    }

    bool isCorner() const noexcept;
    bool isSide() const noexcept;
    bool isCenter() const noexcept;

    // Row-major successor; empty at the last cell.
    std::optional<Position> next() const;

    Position flipH() const;
    Position flipV() const;
    // Quarter turns about the grid center. Only square grids can be
    // rotated; other shapes throw SizeMismatch.
    Position rotateCw() const;
    Position rotateCc() const;

    // True when this position lies in the rectangle spanned by a and b, inclusive.
    bool inside(const Position& a, const Position& b) const noexcept;

    bool operator==(const Position& o) const noexcept {
        return x_ == o.x_ && y_ == o.y_ && width_ == o.width_ && height_ == o.height_;
    }
    bool operator!=(const Position& o) const noexcept { return !(*this == o); }
    bool operator<(const Position& o) const noexcept {
        return (y_ < o.y_) || (y_ == o.y_ && x_ < o.x_);
    }

private:
    Position(std::uint16_t x, std::uint16_t y, std::uint16_t w, std::uint16_t h)
    : x_(x), y_(y), width_(w), height_(h)
    {}

    std::uint16_t x_;
    std::uint16_t y_;
    std::uint16_t width_;
    std::uint16_t height_;
};

struct PositionHash {
    std::size_t operator()(const Position& p) const noexcept {
        return (static_cast<std::size_t>(p.x()) * 73856093u) ^
               (static_cast<std::size_t>(p.y()) * 19349663u);
    }
};

// Move one step; empty when the step would leave the grid.
std::optional<Position> operator+(const Position& p, Direction d);

std::size_t manhattan(const Position& a, const Position& b);
std::size_t chebyshev(const Position& a, const Position& b);

// Direction that moves src closer to dst; empty when they are equal.
std::optional<Direction> directionTo(const Position& src, const Position& dst, bool diagonals);

// Top-left and bottom-right corners of the smallest box holding all positions.
std::pair<Position, Position> boundingBox(const std::vector<Position>& positions);

std::string toString(const Position& p);

/**
 * @brief Restartable row-major sequence of every position of a grid
 */
class PositionRange {
public:
    class iterator {
    public:
        using iterator_category = std::forward_iterator_tag;
        using value_type = Position;
        using difference_type = std::ptrdiff_t;
        using pointer = const Position*;
        using reference = Position;

        iterator(const GridConfig& config, std::size_t index) : config_(config), index_(index) {}

        Position operator*() const { return Position::fromIndex(config_, index_); }
        iterator& operator++() { ++index_; return *this; }
        iterator operator++(int) { iterator tmp = *this; ++index_; return tmp; }
        bool operator==(const iterator& o) const { return index_ == o.index_; }
        bool operator!=(const iterator& o) const { return index_ != o.index_; }

    private:
        GridConfig config_;
        std::size_t index_;
    };

    explicit PositionRange(const GridConfig& config) : config_(config) {}

    iterator begin() const { return iterator(config_, 0); }
    iterator end() const { return iterator(config_, config_.size()); }
    std::size_t size() const { return config_.size(); }

private:
    GridConfig config_;
};

inline PositionRange allPositions(const GridConfig& config) { return PositionRange(config); }

} // namespace gridsearch

namespace std {
template <>
struct hash<gridsearch::Position> : gridsearch::PositionHash {};
}
