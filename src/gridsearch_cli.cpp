#include "gridsearch/astar.hpp"
#include "gridsearch/breadth_first.hpp"
#include "gridsearch/cli_args.hpp"
#include "gridsearch/error.hpp"
#include "gridsearch/logging.hpp"
#include "gridsearch/maze.hpp"
#include "gridsearch/ucs.hpp"

#include <iostream>
#include <string>
#include <vector>

using namespace gridsearch;

namespace {

Path solve(const Maze& maze, const std::string& algorithm, const SearchOptions& options) {
    if (algorithm == "bfs") {
        const Position goal = maze.goal;
        auto result = breadthFirstSearch(maze.start, maze.moveFunction(),
                                         [goal](const Position& p) { return p == goal; }, options);
        return result.path;
    }
    if (algorithm == "astar") {
        return astarSearch(maze.moveFunction(), maze.start, maze.goal, options);
    }
    return uniformCostSearch(maze.costFunction(), maze.start, maze.goal, options);
}

}

int main(int argc, char** argv) {
    auto args = parseCliArgs(std::vector<std::string>(argv + 1, argv + argc), std::cerr);
    if (!args) {
        return 2;
    }
    const std::string& in = args->input;
    const std::string& algorithm = args->algorithm;
    const SearchOptions& options = args->options;
    const Cost rough_cost = args->rough_cost;

    auto log = rclcpp::get_logger("gridsearch.cli");
    try {
        Maze maze = loadMaze(in, rough_cost);
        Path path = solve(maze, algorithm, options);

        std::cout << algorithm << ": " << path.size() << " moves, cost "
                  << pathCost(maze, path) << "\n";
        for (std::size_t k = 0; k < path.size(); ++k) {
            std::cout << (k ? " " : "") << directionName(path[k]);
        }
        std::cout << "\n";
        for (const auto& row : renderPath(maze, path)) {
            std::cout << row << "\n";
        }
    } catch (const Error& e) {
        RCLCPP_ERROR(log, "Search failed: %s", e.what());
        return 1;
    } catch (const std::exception& e) {
        RCLCPP_ERROR(log, "Error: %s", e.what());
        return 1;
    }
    return 0;
}
