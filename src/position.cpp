#include "gridsearch/position.hpp"
#include "gridsearch/error.hpp"

#include <algorithm>
#include <cstdlib>
#include <limits>
#include <sstream>

namespace gridsearch {

namespace {

constexpr int kMaxDimension = std::numeric_limits<std::uint16_t>::max();

std::size_t absDiff(int a, int b) {
    return static_cast<std::size_t>(a > b ? a - b : b - a);
}

}

GridConfig::GridConfig(int width, int height)
: width_(0), height_(0)
{
    if (width <= 0 || height <= 0) {
        throw Error(ErrorCode::Empty, "grid dimensions must be positive");
    }
    if (width > kMaxDimension || height > kMaxDimension) {
        throw Error(ErrorCode::OutOfBounds, "grid dimensions must fit in 16 bits");
    }
    width_ = static_cast<std::uint16_t>(width);
    height_ = static_cast<std::uint16_t>(height);
}

Position GridConfig::first() const {
    return Position::create(*this, 0, 0);
}

Position GridConfig::last() const {
    return Position::create(*this, width_ - 1, height_ - 1);
}

Position GridConfig::center() const {
    return Position::create(*this, width_ / 2, height_ / 2);
}

Position Position::create(const GridConfig& config, int x, int y) {
    auto p = tryCreate(config, x, y);
    if (!p) {
        std::ostringstream ss;
        ss << "(" << x << "," << y << ") outside " << config.width() << "x" << config.height();
        throw Error(ErrorCode::OutOfBounds, ss.str());
    }
    return *p;
}

std::optional<Position> Position::tryCreate(const GridConfig& config, int x, int y) {
    if (!config.contains(x, y)) {
        return std::nullopt;
    }
    return Position(static_cast<std::uint16_t>(x), static_cast<std::uint16_t>(y),
                    config.width(), config.height());
}

Position Position::fromIndex(const GridConfig& config, std::size_t index) {
    if (index >= config.size()) {
        throw Error(ErrorCode::OutOfBounds, "index " + std::to_string(index));
    }
    const auto x = static_cast<std::uint16_t>(index % config.width());
    const auto y = static_cast<std::uint16_t>(index / config.width());
    return Position(x, y, config.width(), config.height());
}

bool Position::isCorner() const noexcept {
    return (x_ == 0 || x_ == width_ - 1) && (y_ == 0 || y_ == height_ - 1);
}

bool Position::isSide() const noexcept {
    return x_ == 0 || x_ == width_ - 1 || y_ == 0 || y_ == height_ - 1;
}

bool Position::isCenter() const noexcept {
    return x_ == width_ / 2 && y_ == height_ / 2;
}

std::optional<Position> Position::next() const {
    const std::size_t i = index() + 1;
    if (i >= static_cast<std::size_t>(width_) * height_) {
        return std::nullopt;
    }
    return fromIndex(config(), i);
}

Position Position::flipH() const {
    return Position(static_cast<std::uint16_t>(width_ - x_ - 1), y_, width_, height_);
}

Position Position::flipV() const {
    return Position(x_, static_cast<std::uint16_t>(height_ - y_ - 1), width_, height_);
}

Position Position::rotateCw() const {
    if (width_ != height_) {
        throw Error(ErrorCode::SizeMismatch, "rotating a position of a non-square grid");
    }
    return Position(static_cast<std::uint16_t>(width_ - 1 - y_), x_, width_, height_);
}

Position Position::rotateCc() const {
    if (width_ != height_) {
        throw Error(ErrorCode::SizeMismatch, "rotating a position of a non-square grid");
    }
    return Position(y_, static_cast<std::uint16_t>(width_ - 1 - x_), width_, height_);
}

bool Position::inside(const Position& a, const Position& b) const noexcept {
    const int xmin = std::min(a.x(), b.x());
    const int xmax = std::max(a.x(), b.x());
    const int ymin = std::min(a.y(), b.y());
    const int ymax = std::max(a.y(), b.y());
    return xmin <= x_ && x_ <= xmax && ymin <= y_ && y_ <= ymax;
}

std::optional<Position> operator+(const Position& p, Direction d) {
    const auto [dx, dy] = delta(d);
    return Position::tryCreate(p.config(), p.x() + dx, p.y() + dy);
}

std::size_t manhattan(const Position& a, const Position& b) {
    return absDiff(a.x(), b.x()) + absDiff(a.y(), b.y());
}

std::size_t chebyshev(const Position& a, const Position& b) {
    return std::max(absDiff(a.x(), b.x()), absDiff(a.y(), b.y()));
}

std::optional<Direction> directionTo(const Position& src, const Position& dst, bool diagonals) {
    const int sx = (dst.x() > src.x()) - (dst.x() < src.x());
    const int sy = (dst.y() > src.y()) - (dst.y() < src.y());
    if (sx == 0 && sy == 0) {
        return std::nullopt;
    }
    if (diagonals) {
        return directionFromDelta(sx, sy);
    }
    // Same preference order as the 4-way set.
    if (sy < 0) return Direction::N;
    if (sx > 0) return Direction::E;
    if (sy > 0) return Direction::S;
    return Direction::W;
}

std::pair<Position, Position> boundingBox(const std::vector<Position>& positions) {
    if (positions.empty()) {
        throw Error(ErrorCode::Empty, "bounding box of no positions");
    }
    const GridConfig config = positions.front().config();
    int xmin = positions.front().x();
    int xmax = xmin;
    int ymin = positions.front().y();
    int ymax = ymin;
    for (const auto& p : positions) {
        xmin = std::min(xmin, p.x());
        xmax = std::max(xmax, p.x());
        ymin = std::min(ymin, p.y());
        ymax = std::max(ymax, p.y());
    }
    return {Position::create(config, xmin, ymin), Position::create(config, xmax, ymax)};
}

std::string toString(const Position& p) {
    return "(" + std::to_string(p.x()) + "," + std::to_string(p.y()) + ")";
}

} // namespace gridsearch
