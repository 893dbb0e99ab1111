#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "core/context.hpp"

namespace modgraph::model {

struct BuildConfig {
    // Batch used by `order` when no application is named.
    std::vector<std::string> applications;
    // Manifest output directory; empty means stdout.
    std::filesystem::path outputDir;
};

BuildConfig loadBuildConfig(const std::filesystem::path &appDir, const modgraph::Context &ctx);

} // namespace modgraph::model
