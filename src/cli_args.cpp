#include "gridsearch/cli_args.hpp"

#include <stdexcept>

namespace gridsearch {

void printUsage(std::ostream& err) {
    err << "Usage: gridsearch_cli --input maze.txt [--algorithm bfs|astar|ucs] "
           "[--diagonal] [--storage dense|sparse] [--rough-cost 2]\n";
}

std::optional<CliArgs> parseCliArgs(const std::vector<std::string>& args, std::ostream& err) {
    CliArgs out;
    for (std::size_t i = 0; i < args.size(); ++i) {
        const std::string& a = args[i];
        auto need = [&](const char* name) -> std::optional<std::string> {
            if (++i >= args.size()) {
                err << "Missing " << name << "\n";
                return std::nullopt;
            }
            return args[i];
        };

        if (a == "--input" || a == "-i") {
            auto value = need("--input");
            if (!value) return std::nullopt;
            out.input = *value;
        } else if (a == "--algorithm" || a == "-a") {
            auto value = need("--algorithm");
            if (!value) return std::nullopt;
            out.algorithm = *value;
        } else if (a == "--diagonal" || a == "-d") {
            out.options.diagonals = true;
        } else if (a == "--storage" || a == "-s") {
            auto value = need("--storage");
            if (!value) return std::nullopt;
            if (*value == "sparse") {
                out.options.storage = StorageKind::Sparse;
            } else if (*value == "dense") {
                out.options.storage = StorageKind::Dense;
            } else {
                err << "Unknown storage " << *value << "\n";
                return std::nullopt;
            }
        } else if (a == "--rough-cost" || a == "-r") {
            auto value = need("--rough-cost");
            if (!value) return std::nullopt;
            try {
                out.rough_cost = std::stoll(*value);
            } catch (const std::logic_error&) {
                err << "Bad --rough-cost " << *value << "\n";
                return std::nullopt;
            }
        } else {
            err << "Unknown arg " << a << "\n";
            return std::nullopt;
        }
    }

    if (out.input.empty() ||
        (out.algorithm != "bfs" && out.algorithm != "astar" && out.algorithm != "ucs")) {
        printUsage(err);
        return std::nullopt;
    }
    return out;
}

} // namespace gridsearch
