#pragma once

#include <filesystem>

#include "nlohmann/json.hpp"

namespace modgraph::io {

// Parses a JSON object from path. Throws model::NotFoundError when the file
// is missing and model::ParseError when it is not a JSON object.
nlohmann::json loadJsonFile(const std::filesystem::path &path);

} // namespace modgraph::io
