#pragma once

#include <map>
#include <string>
#include <vector>

#include "nlohmann/json.hpp"

namespace modgraph::model {

struct ModuleSpec {
    std::string name;
    std::vector<std::string> dependencies;
    std::vector<std::string> resources;

    // Source document, including keys the resolver does not interpret.
    nlohmann::json raw = nlohmann::json::object();
};

// Module entries of one application document, in declaration order.
using ModuleList = std::vector<ModuleSpec>;

// Flattened module set keyed by name.
using ModuleMap = std::map<std::string, ModuleSpec>;

inline const ModuleSpec *findModule(const ModuleList &modules, const std::string &name)
{
    for (const auto &module : modules)
    {
        if (module.name == name)
        {
            return &module;
        }
    }
    return nullptr;
}

} // namespace modgraph::model
