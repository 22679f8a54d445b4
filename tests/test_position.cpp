/**
 * @file test_position.cpp
 * @brief Unit tests for GridConfig, Position and Direction
 */

#include <gtest/gtest.h>

#include <functional>
#include <set>
#include <vector>

#include "gridsearch/error.hpp"
#include "gridsearch/position.hpp"

using namespace gridsearch;

namespace {

ErrorCode codeOf(const std::function<void()>& fn) {
    try {
        fn();
    } catch (const Error& e) {
        return e.code();
    }
    ADD_FAILURE() << "no gridsearch::Error thrown";
    return ErrorCode::Empty;
}

}

class PositionTest : public ::testing::Test {
protected:
    PositionTest()
        : grid3(3, 3), grid75(7, 5)
    {
    }

    Position at3(int x, int y) const { return Position::create(grid3, x, y); }

    GridConfig grid3;
    GridConfig grid75;
};

// =============================================================================
// GridConfig
// =============================================================================

TEST_F(PositionTest, ConfigDimensions)
{
    EXPECT_EQ(grid75.width(), 7);
    EXPECT_EQ(grid75.height(), 5);
    EXPECT_EQ(grid75.size(), 35u);
    EXPECT_EQ(grid75.first().xy(), std::make_pair(0, 0));
    EXPECT_EQ(grid75.last().xy(), std::make_pair(6, 4));
    EXPECT_EQ(grid75.center().xy(), std::make_pair(3, 2));
}

TEST_F(PositionTest, ConfigRejectsBadDimensions)
{
    EXPECT_EQ(codeOf([] { GridConfig(0, 3); }), ErrorCode::Empty);
    EXPECT_EQ(codeOf([] { GridConfig(3, -1); }), ErrorCode::Empty);
    EXPECT_EQ(codeOf([] { GridConfig(70000, 1); }), ErrorCode::OutOfBounds);
    EXPECT_NO_THROW(GridConfig(65535, 1));
}

// =============================================================================
// Construction and linear index
// =============================================================================

TEST_F(PositionTest, CreateOutOfBounds)
{
    EXPECT_EQ(codeOf([this] { Position::create(grid3, 3, 0); }), ErrorCode::OutOfBounds);
    EXPECT_EQ(codeOf([this] { Position::create(grid3, 0, -1); }), ErrorCode::OutOfBounds);
    EXPECT_FALSE(Position::tryCreate(grid3, -1, 2).has_value());
    ASSERT_TRUE(Position::tryCreate(grid3, 2, 2).has_value());
    EXPECT_EQ(Position::tryCreate(grid3, 2, 2)->index(), 8u);
}

TEST_F(PositionTest, IndexIsBijective)
{
    std::set<std::size_t> seen;
    std::size_t expected = 0;
    for (const auto& pos : allPositions(grid75)) {
        EXPECT_EQ(pos.index(), expected);
        EXPECT_EQ(pos.index(), static_cast<std::size_t>(pos.y() * 7 + pos.x()));
        EXPECT_EQ(Position::fromIndex(grid75, pos.index()), pos);
        seen.insert(pos.index());
        ++expected;
    }
    EXPECT_EQ(seen.size(), grid75.size());
    EXPECT_EQ(codeOf([this] { Position::fromIndex(grid75, 35); }), ErrorCode::OutOfBounds);
}

TEST_F(PositionTest, NextWalksRowMajor)
{
    auto p = at3(2, 0).next();
    ASSERT_TRUE(p.has_value());
    EXPECT_EQ(p->xy(), std::make_pair(0, 1));
    EXPECT_FALSE(grid3.last().next().has_value());
    EXPECT_TRUE(at3(2, 0) < at3(0, 1));
    EXPECT_FALSE(at3(0, 1) < at3(2, 0));
}

// =============================================================================
// Predicates and transforms
// =============================================================================

TEST_F(PositionTest, Predicates)
{
    EXPECT_TRUE(at3(0, 0).isCorner());
    EXPECT_TRUE(at3(2, 2).isCorner());
    EXPECT_FALSE(at3(1, 0).isCorner());
    EXPECT_TRUE(at3(1, 0).isSide());
    EXPECT_FALSE(at3(1, 1).isSide());
    EXPECT_TRUE(at3(1, 1).isCenter());
    EXPECT_FALSE(at3(0, 1).isCenter());
}

TEST_F(PositionTest, FlipAndInside)
{
    auto p = Position::create(grid75, 1, 3);
    EXPECT_EQ(p.flipH().xy(), std::make_pair(5, 3));
    EXPECT_EQ(p.flipV().xy(), std::make_pair(1, 1));
    EXPECT_EQ(p.flipH().flipH(), p);

    auto a = Position::create(grid75, 4, 4);
    auto b = Position::create(grid75, 0, 2);
    EXPECT_TRUE(p.inside(a, b));
    EXPECT_TRUE(a.inside(a, b));
    EXPECT_FALSE(Position::create(grid75, 5, 3).inside(a, b));
}

TEST_F(PositionTest, QuarterTurns)
{
    GridConfig grid5(5, 5);
    const auto topLeft = grid5.first();
    const auto topRight = Position::create(grid5, 4, 0);
    const auto bottomRight = grid5.last();
    const auto bottomLeft = Position::create(grid5, 0, 4);
    EXPECT_EQ(topLeft.rotateCw(), topRight);
    EXPECT_EQ(topRight.rotateCw(), bottomRight);
    EXPECT_EQ(bottomRight.rotateCw(), bottomLeft);
    EXPECT_EQ(bottomLeft.rotateCw(), topLeft);
    EXPECT_EQ(topLeft.rotateCc(), bottomLeft);
    EXPECT_EQ(Position::create(grid5, 1, 0).rotateCw().xy(), std::make_pair(4, 1));
    EXPECT_EQ(Position::create(grid5, 1, 0).rotateCc().xy(), std::make_pair(0, 3));
    EXPECT_EQ(grid5.center().rotateCw(), grid5.center());

    for (const auto& pos : allPositions(grid5)) {
        EXPECT_EQ(pos.rotateCw().rotateCw().rotateCw().rotateCw(), pos);
        EXPECT_EQ(pos.rotateCw().rotateCc(), pos);
        EXPECT_EQ(pos.rotateCw().rotateCw(), pos.rotateCc().rotateCc());
        EXPECT_EQ(pos.rotateCw().isCorner(), pos.isCorner());
        EXPECT_EQ(pos.rotateCc().isSide(), pos.isSide());
    }
}

TEST_F(PositionTest, RotateNeedsSquareGrid)
{
    const auto p = Position::create(grid75, 1, 1);
    EXPECT_EQ(codeOf([&] { p.rotateCw(); }), ErrorCode::SizeMismatch);
    EXPECT_EQ(codeOf([&] { p.rotateCc(); }), ErrorCode::SizeMismatch);
}

// =============================================================================
// Movement
// =============================================================================

TEST_F(PositionTest, StepOffGridIsEmpty)
{
    EXPECT_FALSE((grid3.first() + Direction::N).has_value());
    EXPECT_FALSE((grid3.first() + Direction::W).has_value());
    EXPECT_FALSE((grid3.last() + Direction::SE).has_value());
    auto p = grid3.first() + Direction::SE;
    ASSERT_TRUE(p.has_value());
    EXPECT_EQ(*p, at3(1, 1));
}

TEST_F(PositionTest, InverseStepReturns)
{
    const auto center = at3(1, 1);
    for (Direction d : directions(true)) {
        auto moved = center + d;
        ASSERT_TRUE(moved.has_value()) << directionName(d);
        auto back = *moved + inverse(d);
        ASSERT_TRUE(back.has_value());
        EXPECT_EQ(*back, center) << directionName(d);
    }
}

TEST_F(PositionTest, Distances)
{
    auto a = Position::create(grid75, 1, 4);
    auto b = Position::create(grid75, 6, 1);
    EXPECT_EQ(manhattan(a, b), 8u);
    EXPECT_EQ(chebyshev(a, b), 5u);
    EXPECT_EQ(manhattan(a, a), 0u);
}

TEST_F(PositionTest, DirectionTo)
{
    const auto c = at3(1, 1);
    EXPECT_EQ(directionTo(c, at3(2, 0), true), Direction::NE);
    EXPECT_EQ(directionTo(c, at3(0, 2), true), Direction::SW);
    EXPECT_EQ(directionTo(c, at3(2, 0), false), Direction::N);
    EXPECT_EQ(directionTo(c, at3(2, 2), false), Direction::E);
    EXPECT_EQ(directionTo(c, at3(0, 2), false), Direction::S);
    EXPECT_EQ(directionTo(c, at3(0, 1), false), Direction::W);
    EXPECT_FALSE(directionTo(c, c, true).has_value());
}

TEST_F(PositionTest, BoundingBox)
{
    std::vector<Position> v = {
        Position::create(grid75, 3, 1),
        Position::create(grid75, 1, 3),
        Position::create(grid75, 5, 2),
    };
    auto box = boundingBox(v);
    EXPECT_EQ(box.first.xy(), std::make_pair(1, 1));
    EXPECT_EQ(box.second.xy(), std::make_pair(5, 3));
    EXPECT_EQ(codeOf([] { boundingBox({}); }), ErrorCode::Empty);
}

TEST_F(PositionTest, ToStringAndHash)
{
    EXPECT_EQ(toString(Position::create(grid75, 2, 3)), "(2,3)");
    PositionHash hash;
    EXPECT_EQ(hash(at3(1, 2)), hash(at3(1, 2)));
    EXPECT_EQ(std::hash<Position>{}(at3(1, 2)), hash(at3(1, 2)));
}

// =============================================================================
// Direction
// =============================================================================

TEST(DirectionTest, Sets)
{
    const std::vector<Direction> four = {Direction::N, Direction::E, Direction::S, Direction::W};
    EXPECT_EQ(directions(false), four);
    ASSERT_EQ(directions(true).size(), 8u);
    for (int i = 0; i < kDirectionCount; ++i) {
        EXPECT_EQ(directionIndex(directions(true)[i]), i);
        EXPECT_EQ(isDiagonal(directions(true)[i]), i % 2 == 1);
    }
}

TEST(DirectionTest, InverseAndRotate)
{
    EXPECT_EQ(inverse(Direction::N), Direction::S);
    EXPECT_EQ(inverse(Direction::NE), Direction::SW);
    EXPECT_EQ(inverse(Direction::W), Direction::E);
    for (Direction d : directions(true)) {
        EXPECT_EQ(inverse(inverse(d)), d);
        EXPECT_EQ(rotate(d, Direction::N), d);
        EXPECT_EQ(rotate(d, Direction::S), inverse(d));
    }
    EXPECT_EQ(rotate(Direction::N, Direction::E), Direction::E);
    EXPECT_EQ(rotate(Direction::W, Direction::SE), Direction::NE);
}

TEST(DirectionTest, Deltas)
{
    EXPECT_EQ(delta(Direction::N), std::make_pair(0, -1));
    EXPECT_EQ(delta(Direction::SE), std::make_pair(1, 1));
    EXPECT_EQ(delta(Direction::W), std::make_pair(-1, 0));
    for (Direction d : directions(true)) {
        const auto [dx, dy] = delta(d);
        EXPECT_EQ(directionFromDelta(dx, dy), d);
    }
    EXPECT_FALSE(directionFromDelta(0, 0).has_value());
    EXPECT_FALSE(directionFromDelta(2, 0).has_value());
    EXPECT_EQ(codeOf([] { delta(static_cast<Direction>(9)); }), ErrorCode::InvalidDirection);
}

TEST(DirectionTest, Names)
{
    EXPECT_STREQ(directionName(Direction::N), "N");
    EXPECT_STREQ(directionName(Direction::SW), "SW");
    EXPECT_EQ(directionAscii(Direction::E), '>');
    EXPECT_EQ(directionAscii(Direction::S), 'v');
}
