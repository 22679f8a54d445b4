#pragma once

#include <optional>
#include <ostream>
#include <string>
#include <vector>

#include "gridsearch/search.hpp"

namespace gridsearch {

/**
 * @brief Command line settings of gridsearch_cli
 */
struct CliArgs {
    std::string input;
    std::string algorithm = "astar";
    SearchOptions options;
    Cost rough_cost = 2;
};

// Parses everything after the program name. Problems are reported on
// `err` and give an empty result.
std::optional<CliArgs> parseCliArgs(const std::vector<std::string>& args, std::ostream& err);

void printUsage(std::ostream& err);

} // namespace gridsearch
