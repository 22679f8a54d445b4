#pragma once

#include <functional>
#include <optional>
#include <unordered_map>
#include <unordered_set>

#include "gridsearch/position.hpp"

namespace gridsearch {

/**
 * @brief Map from Position to V, independent of how it is stored
 *
 * The search engine is written against this interface only. Dense
 * implementations hold a value for every cell; sparse ones return an
 * empty optional for cells that were never set.
 */
template<typename V>
class KeyedStore {
public:
    virtual ~KeyedStore() = default;

    virtual std::optional<V> get(const Position& pos) const = 0;
    virtual void set(const Position& pos, const V& value) = 0;
    virtual void forEach(const std::function<void(const Position&, const V&)>& fn) const = 0;
};

/**
 * @brief Set of positions, independent of how it is stored
 */
class PositionSet {
public:
    virtual ~PositionSet() = default;

    virtual bool contains(const Position& pos) const = 0;
    virtual void insert(const Position& pos) = 0;
    virtual void remove(const Position& pos) = 0;
    virtual void forEach(const std::function<void(const Position&)>& fn) const = 0;
};

// Hash-backed store, memory proportional to the entries written.
template<typename V>
class SparseMap : public KeyedStore<V> {
public:
    std::optional<V> get(const Position& pos) const override {
        auto it = entries_.find(pos);
        if (it == entries_.end()) return std::nullopt;
        return it->second;
    }

    void set(const Position& pos, const V& value) override {
        entries_.insert_or_assign(pos, value);
    }

    void forEach(const std::function<void(const Position&, const V&)>& fn) const override {
        for (const auto& entry : entries_) {
            fn(entry.first, entry.second);
        }
    }

    std::size_t size() const { return entries_.size(); }

private:
    std::unordered_map<Position, V, PositionHash> entries_;
};

class SparseSet : public PositionSet {
public:
    bool contains(const Position& pos) const override { return members_.count(pos) != 0; }
    void insert(const Position& pos) override { members_.insert(pos); }
    void remove(const Position& pos) override { members_.erase(pos); }

    void forEach(const std::function<void(const Position&)>& fn) const override {
        for (const auto& pos : members_) {
            fn(pos);
        }
    }

    std::size_t size() const { return members_.size(); }

private:
    std::unordered_set<Position, PositionHash> members_;
};

} // namespace gridsearch
