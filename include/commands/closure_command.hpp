#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "core/context.hpp"

namespace modgraph::commands {

int runClosureCommand(
    const modgraph::Context &ctx,
    const std::filesystem::path &appDir,
    const std::vector<std::string> &args
);

} // namespace modgraph::commands
