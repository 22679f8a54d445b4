#pragma once

#include <algorithm>
#include <cstddef>
#include <iterator>
#include <string>
#include <utility>
#include <vector>

#include "gridsearch/error.hpp"
#include "gridsearch/position.hpp"
#include "gridsearch/storage.hpp"

namespace gridsearch {

template<typename It>
class Slice {
public:
    Slice(It first, It last) : first_(first), last_(last) {}

    It begin() const { return first_; }
    It end() const { return last_; }
    std::size_t size() const { return static_cast<std::size_t>(std::distance(first_, last_)); }
    decltype(auto) operator[](std::size_t i) const { return *(first_ + i); }

private:
    It first_;
    It last_;
};

/**
 * @brief One value per grid cell, stored in row-major order
 *
 * Holds exactly width*height entries, so lookups never miss. Use
 * BitsetMap instead of DenseMap<bool> for packed booleans.
 */
template<typename V>
class DenseMap : public KeyedStore<V> {
public:
    using ConstLine = Slice<typename std::vector<V>::const_iterator>;
    using Line = Slice<typename std::vector<V>::iterator>;

    DenseMap(const GridConfig& config, const V& fill)
    : config_(config), values_(config.size(), fill)
    {}

    // Takes exactly width*height values in row-major order.
    static DenseMap fromValues(const GridConfig& config, std::vector<V> values) {
        if (values.size() != config.size()) {
            throw Error(ErrorCode::SizeMismatch,
                        "got " + std::to_string(values.size()) +
                        " values for " + std::to_string(config.size()) + " cells");
        }
        DenseMap m(config, V{});
        m.values_ = std::move(values);
        return m;
    }

    // Rows may be shorter than the grid; missing cells get V{}.
    static DenseMap fromRows(const GridConfig& config, const std::vector<std::vector<V>>& rows) {
        if (rows.size() > config.height()) {
            throw Error(ErrorCode::OutOfBounds, "too many rows");
        }
        DenseMap m(config, V{});
        for (std::size_t y = 0; y < rows.size(); ++y) {
            if (rows[y].size() > config.width()) {
                throw Error(ErrorCode::OutOfBounds, "row " + std::to_string(y) + " too long");
            }
            std::copy(rows[y].begin(), rows[y].end(),
                      m.values_.begin() + static_cast<std::ptrdiff_t>(y * config.width()));
        }
        return m;
    }

    const GridConfig& config() const { return config_; }

    // Every accessor throws OutOfBounds for a position of another grid size.
    const V& at(const Position& pos) const { checkPosition(pos); return values_[pos.index()]; }
    V& at(const Position& pos) { checkPosition(pos); return values_[pos.index()]; }

    decltype(auto) operator[](const Position& pos) const { checkPosition(pos); return values_[pos.index()]; }
    decltype(auto) operator[](const Position& pos) { checkPosition(pos); return values_[pos.index()]; }

    std::optional<V> get(const Position& pos) const override {
        checkPosition(pos);
        return values_[pos.index()];
    }
    void set(const Position& pos, const V& value) override {
        checkPosition(pos);
        values_[pos.index()] = value;
    }

    void forEach(const std::function<void(const Position&, const V&)>& fn) const override {
        for (std::size_t i = 0; i < values_.size(); ++i) {
            fn(Position::fromIndex(config_, i), values_[i]);
        }
    }

    ConstLine line(int row) const {
        checkRow(row);
        auto first = values_.cbegin() + static_cast<std::ptrdiff_t>(row) * config_.width();
        return ConstLine(first, first + config_.width());
    }

    Line line(int row) {
        checkRow(row);
        auto first = values_.begin() + static_cast<std::ptrdiff_t>(row) * config_.width();
        return Line(first, first + config_.width());
    }

    std::vector<V> column(int col) const {
        if (col < 0 || col >= config_.width()) {
            throw Error(ErrorCode::OutOfBounds, "column " + std::to_string(col));
        }
        std::vector<V> out;
        out.reserve(config_.height());
        for (int y = 0; y < config_.height(); ++y) {
            out.push_back(values_[static_cast<std::size_t>(y) * config_.width() + col]);
        }
        return out;
    }

    // Whole backing array, for bulk operations.
    const std::vector<V>& values() const { return values_; }
    std::vector<V>& values() { return values_; }

    void flipH() {
        for (int y = 0; y < config_.height(); ++y) {
            auto row = line(y);
            std::reverse(row.begin(), row.end());
        }
    }

    void flipV() {
        for (int y = 0; y < config_.height() / 2; ++y) {
            auto top = line(y);
            auto bottom = line(config_.height() - 1 - y);
            std::swap_ranges(top.begin(), top.end(), bottom.begin());
        }
    }

    // Square grids only; SizeMismatch otherwise.
    void rotateCw() {
        checkSquare();
        const int n = config_.width();
        for (int y = 0; y < n / 2; ++y) {
            for (int x = y; x < n - 1 - y; ++x) {
                const Position p0 = Position::create(config_, x, y);
                const Position p1 = p0.rotateCw();
                const Position p2 = p1.rotateCw();
                const Position p3 = p2.rotateCw();
                std::swap(values_[p0.index()], values_[p1.index()]);
                std::swap(values_[p0.index()], values_[p2.index()]);
                std::swap(values_[p0.index()], values_[p3.index()]);
            }
        }
    }

    void rotateCc() {
        checkSquare();
        const int n = config_.width();
        for (int y = 0; y < n / 2; ++y) {
            for (int x = y; x < n - 1 - y; ++x) {
                const Position p0 = Position::create(config_, x, y);
                const Position p1 = p0.rotateCw();
                const Position p2 = p1.rotateCw();
                const Position p3 = p2.rotateCw();
                std::swap(values_[p0.index()], values_[p3.index()]);
                std::swap(values_[p0.index()], values_[p2.index()]);
                std::swap(values_[p0.index()], values_[p1.index()]);
            }
        }
    }

    bool operator==(const DenseMap& o) const { return config_ == o.config_ && values_ == o.values_; }
    bool operator!=(const DenseMap& o) const { return !(*this == o); }

private:
    void checkPosition(const Position& pos) const {
        if (pos.config() != config_) {
            throw Error(ErrorCode::OutOfBounds,
                        toString(pos) + " belongs to a " + std::to_string(pos.config().width()) + "x" +
                        std::to_string(pos.config().height()) + " grid, not " +
                        std::to_string(config_.width()) + "x" + std::to_string(config_.height()));
        }
    }

    void checkSquare() const {
        if (config_.width() != config_.height()) {
            throw Error(ErrorCode::SizeMismatch, "rotating a non-square grid");
        }
    }

    void checkRow(int row) const {
        if (row < 0 || row >= config_.height()) {
            throw Error(ErrorCode::OutOfBounds, "row " + std::to_string(row));
        }
    }

    GridConfig config_;
    std::vector<V> values_;
};

} // namespace gridsearch
