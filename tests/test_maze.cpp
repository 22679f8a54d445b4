/**
 * @file test_maze.cpp
 * @brief Tests for parsing, loading and rendering text mazes
 */

#include <gtest/gtest.h>

#include <fstream>
#include <stdexcept>
#include <string>
#include <vector>

#include "gridsearch/error.hpp"
#include "gridsearch/maze.hpp"

using namespace gridsearch;

// =============================================================================
// Parsing
// =============================================================================

TEST(MazeTest, ParseCells)
{
    Maze maze = parseMaze({
        "#S.",
        "~.G",
    }, 3);
    EXPECT_EQ(maze.config(), GridConfig(3, 2));
    EXPECT_EQ(maze.start.xy(), std::make_pair(1, 0));
    EXPECT_EQ(maze.goal.xy(), std::make_pair(2, 1));
    EXPECT_TRUE(maze.walls.get(maze.config().first()));
    EXPECT_EQ(maze.walls.count(), 1u);
    EXPECT_EQ(maze.costs.at(Position::create(maze.config(), 0, 1)), 3);
    EXPECT_EQ(maze.costs.at(maze.goal), 1);
}

TEST(MazeTest, DefaultStartAndGoal)
{
    Maze maze = parseMaze({"...", "..."});
    EXPECT_EQ(maze.start, maze.config().first());
    EXPECT_EQ(maze.goal, maze.config().last());
}

TEST(MazeTest, MoveFunctionsRespectWalls)
{
    Maze maze = parseMaze({"S#", "~G"});
    auto move = maze.moveFunction();
    EXPECT_FALSE(move(maze.start, Direction::E).has_value());
    EXPECT_FALSE(move(maze.start, Direction::N).has_value());
    ASSERT_TRUE(move(maze.start, Direction::S).has_value());

    auto cost = maze.costFunction();
    auto edge = cost(maze.start, Direction::S);
    ASSERT_TRUE(edge.has_value());
    EXPECT_EQ(edge->first.xy(), std::make_pair(0, 1));
    EXPECT_EQ(edge->second, 2);
}

TEST(MazeTest, ParseErrors)
{
    try {
        parseMaze({"...", ".."});
        FAIL() << "expected SizeMismatch";
    } catch (const Error& e) {
        EXPECT_EQ(e.code(), ErrorCode::SizeMismatch);
    }
    try {
        parseMaze({});
        FAIL() << "expected Empty";
    } catch (const Error& e) {
        EXPECT_EQ(e.code(), ErrorCode::Empty);
    }
    try {
        parseMaze({"..."}, -1);
        FAIL() << "expected InvalidCost";
    } catch (const Error& e) {
        EXPECT_EQ(e.code(), ErrorCode::InvalidCost);
    }
    EXPECT_THROW(parseMaze({".x."}), std::runtime_error);
}

// =============================================================================
// Paths
// =============================================================================

TEST(MazeTest, RenderPath)
{
    Maze maze = parseMaze({
        "S..",
        ".#~",
        "..G",
    });
    const Path path = {Direction::E, Direction::E, Direction::S, Direction::S};
    const std::vector<std::string> expected = {
        "S>v",
        ".#v",
        "..G",
    };
    EXPECT_EQ(renderPath(maze, path), expected);
    EXPECT_EQ(pathCost(maze, path), 5);

    const std::vector<std::string> bare = {
        "S..",
        ".#~",
        "..G",
    };
    EXPECT_EQ(renderPath(maze, {}), bare);
}

TEST(MazeTest, PathOffGrid)
{
    Maze maze = parseMaze({"SG"});
    EXPECT_THROW(pathCost(maze, {Direction::N}), Error);
    EXPECT_THROW(renderPath(maze, {Direction::W}), Error);
}

// =============================================================================
// Files
// =============================================================================

TEST(MazeTest, LoadFile)
{
    const std::string path = ::testing::TempDir() + "gridsearch_maze.txt";
    {
        std::ofstream out(path);
        out << "S.#\r\n";
        out << "\n";
        out << "..G\n";
    }
    Maze maze = loadMaze(path);
    EXPECT_EQ(maze.config(), GridConfig(3, 2));
    EXPECT_EQ(maze.goal.xy(), std::make_pair(2, 1));

    EXPECT_THROW(loadMaze(path + ".missing"), std::runtime_error);
}
