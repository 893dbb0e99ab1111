#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "core/context.hpp"

namespace modgraph::io {

bool ensureDir(const std::filesystem::path &path);

// Replaces file with content, creating its parent directory if needed.
bool writeTextFile(const std::filesystem::path &file, const std::string &content, const modgraph::Context &ctx);

// entrypoints/<name>/<name>.json under appDir, sorted.
std::vector<std::filesystem::path> listEntrypointFiles(const std::filesystem::path &appDir);

} // namespace modgraph::io
