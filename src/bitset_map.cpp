#include "gridsearch/bitset_map.hpp"
#include "gridsearch/error.hpp"

#include <bitset>
#include <string>

namespace gridsearch {

BitsetMap::BitsetMap(const GridConfig& config, bool fill)
: config_(config),
  words_((config.size() + kWordBits - 1) / kWordBits, fill ? 0xFFFFFFFFu : 0u)
{
    clearPadding();
}

BitsetMap BitsetMap::fromPositions(const GridConfig& config, const std::vector<Position>& positions) {
    BitsetMap m(config);
    for (const auto& pos : positions) {
        m.setTrue(pos);
    }
    return m;
}

BitsetMap BitsetMap::fromBools(const GridConfig& config, const std::vector<bool>& values) {
    if (values.size() != config.size()) {
        throw Error(ErrorCode::SizeMismatch,
                    "got " + std::to_string(values.size()) +
                    " values for " + std::to_string(config.size()) + " cells");
    }
    BitsetMap m(config);
    for (std::size_t i = 0; i < values.size(); ++i) {
        if (values[i]) {
            m.words_[wordIndex(i)] |= bitMask(i);
        }
    }
    return m;
}

void BitsetMap::set(const Position& pos, bool value) {
    if (value) {
        setTrue(pos);
    } else {
        setFalse(pos);
    }
}

void BitsetMap::setTrue(const Position& pos) {
    checkPosition(pos);
    const std::size_t i = pos.index();
    words_[wordIndex(i)] |= bitMask(i);
}

void BitsetMap::setFalse(const Position& pos) {
    checkPosition(pos);
    const std::size_t i = pos.index();
    words_[wordIndex(i)] &= ~bitMask(i);
}

void BitsetMap::forEach(const std::function<void(const Position&)>& fn) const {
    for (const auto& pos : iterateTrue()) {
        fn(pos);
    }
}

std::size_t BitsetMap::count() const {
    std::size_t total = 0;
    for (std::uint32_t word : words_) {
        total += std::bitset<kWordBits>(word).count();
    }
    return total;
}

void BitsetMap::flipH() {
    for (int y = 0; y < config_.height(); ++y) {
        for (int x = 0; x < config_.width() / 2; ++x) {
            const Position a = Position::create(config_, x, y);
            const Position b = a.flipH();
            const bool tmp = get(a);
            set(a, get(b));
            set(b, tmp);
        }
    }
}

void BitsetMap::flipV() {
    for (int y = 0; y < config_.height() / 2; ++y) {
        for (int x = 0; x < config_.width(); ++x) {
            const Position a = Position::create(config_, x, y);
            const Position b = a.flipV();
            const bool tmp = get(a);
            set(a, get(b));
            set(b, tmp);
        }
    }
}

// Each pass moves one ring cell through its four rotated places.
void BitsetMap::rotateCw() {
    if (config_.width() != config_.height()) {
        throw Error(ErrorCode::SizeMismatch, "rotating a non-square grid");
    }
    const int n = config_.width();
    for (int y = 0; y < n / 2; ++y) {
        for (int x = y; x < n - 1 - y; ++x) {
            const Position p0 = Position::create(config_, x, y);
            const Position p1 = p0.rotateCw();
            const Position p2 = p1.rotateCw();
            const Position p3 = p2.rotateCw();
            const bool v0 = get(p0);
            set(p0, get(p3));
            set(p3, get(p2));
            set(p2, get(p1));
            set(p1, v0);
        }
    }
}

void BitsetMap::rotateCc() {
    if (config_.width() != config_.height()) {
        throw Error(ErrorCode::SizeMismatch, "rotating a non-square grid");
    }
    const int n = config_.width();
    for (int y = 0; y < n / 2; ++y) {
        for (int x = y; x < n - 1 - y; ++x) {
            const Position p0 = Position::create(config_, x, y);
            const Position p1 = p0.rotateCw();
            const Position p2 = p1.rotateCw();
            const Position p3 = p2.rotateCw();
            const bool v0 = get(p0);
            set(p0, get(p1));
            set(p1, get(p2));
            set(p2, get(p3));
            set(p3, v0);
        }
    }
}

void BitsetMap::checkPosition(const Position& pos) const {
    if (pos.config() != config_) {
        throw Error(ErrorCode::OutOfBounds,
                    toString(pos) + " belongs to a " + std::to_string(pos.config().width()) + "x" +
                    std::to_string(pos.config().height()) + " grid, not " +
                    std::to_string(config_.width()) + "x" + std::to_string(config_.height()));
    }
}

// Bits past the last cell stay zero so that count() and operator== only see cells.
void BitsetMap::clearPadding() {
    const std::size_t used = config_.size() % kWordBits;
    if (used != 0 && !words_.empty()) {
        words_.back() &= ~(0xFFFFFFFFu >> used);
    }
}

} // namespace gridsearch
