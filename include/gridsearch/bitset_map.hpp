#pragma once

#include <cstddef>
#include <cstdint>
#include <iterator>
#include <vector>

#include "gridsearch/position.hpp"
#include "gridsearch/storage.hpp"

namespace gridsearch {

/**
 * @brief One bit per grid cell, packed into 32-bit words
 *
 * Cell i lives in word i / 32, at bit i % 32 counted from the most
 * significant end. get/set are O(1). iterateTrue() and iterateFalse()
 * scan every cell, so they cost O(width*height) no matter how few bits
 * are set.
 */
class BitsetMap : public PositionSet {
public:
    static constexpr std::size_t kWordBits = 32;

    // Lazy scan over the cells whose bit equals `wanted`.
    class Filter {
    public:
        class iterator {
        public:
            using iterator_category = std::input_iterator_tag;
            using value_type = Position;
            using difference_type = std::ptrdiff_t;
            using pointer = const Position*;
            using reference = Position;

            iterator(const BitsetMap* map, std::size_t index, bool wanted)
            : map_(map), index_(index), wanted_(wanted)
            {
                skip();
            }

            Position operator*() const { return Position::fromIndex(map_->config_, index_); }
            iterator& operator++() { ++index_; skip(); return *this; }
            bool operator==(const iterator& o) const { return index_ == o.index_; }
            bool operator!=(const iterator& o) const { return index_ != o.index_; }

        private:
            void skip() {
                while (index_ < map_->config_.size() && map_->bit(index_) != wanted_) {
                    ++index_;
                }
            }

            const BitsetMap* map_;
            std::size_t index_;
            bool wanted_;
        };

        Filter(const BitsetMap* map, bool wanted) : map_(map), wanted_(wanted) {}

        iterator begin() const { return iterator(map_, 0, wanted_); }
        iterator end() const { return iterator(map_, map_->config_.size(), wanted_); }

    private:
        const BitsetMap* map_;
        bool wanted_;
    };

    explicit BitsetMap(const GridConfig& config, bool fill = false);

    static BitsetMap fromPositions(const GridConfig& config, const std::vector<Position>& positions);
    // Exactly width*height values in row-major order.
    static BitsetMap fromBools(const GridConfig& config, const std::vector<bool>& values);

    const GridConfig& config() const { return config_; }

    // Positions from a grid of another size throw OutOfBounds.
    bool get(const Position& pos) const { checkPosition(pos); return bit(pos.index()); }
    void set(const Position& pos, bool value);
    void setTrue(const Position& pos);
    void setFalse(const Position& pos);

    bool contains(const Position& pos) const override { return get(pos); }
    void insert(const Position& pos) override { setTrue(pos); }
    void remove(const Position& pos) override { setFalse(pos); }
    void forEach(const std::function<void(const Position&)>& fn) const override;

    Filter iterateTrue() const { return Filter(this, true); }
    Filter iterateFalse() const { return Filter(this, false); }

    // Number of true cells.
    std::size_t count() const;

    void flipH();
    void flipV();
    // Square grids only; SizeMismatch otherwise.
    void rotateCw();
    void rotateCc();

    const std::vector<std::uint32_t>& words() const { return words_; }

    bool operator==(const BitsetMap& o) const { return config_ == o.config_ && words_ == o.words_; }
    bool operator!=(const BitsetMap& o) const { return !(*this == o); }

private:
    static std::size_t wordIndex(std::size_t i) { return i / kWordBits; }
    static std::uint32_t bitMask(std::size_t i) {
        return static_cast<std::uint32_t>(0x80000000u) >> (i % kWordBits);
    }

    bool bit(std::size_t i) const { return (words_[wordIndex(i)] & bitMask(i)) != 0; }
    void checkPosition(const Position& pos) const;
    void clearPadding();

    GridConfig config_;
    std::vector<std::uint32_t> words_;
};

} // namespace gridsearch
