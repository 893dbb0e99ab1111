#pragma once

#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

#include "core/context.hpp"

namespace modgraph::commands {

struct GlobalOptions {
    std::filesystem::path appDir;
    bool verbose = false;
    // Index in args of the sub-command; args.size() when none was given.
    std::size_t commandIndex = 0;
};

// Consumes leading --dir/--verbose options.
bool parseGlobalOptions(const std::vector<std::string> &args, GlobalOptions &opt, const modgraph::Context &ctx);

} // namespace modgraph::commands
