#pragma once

#include <string>
#include <unordered_map>
#include <vector>

#include "core/context.hpp"
#include "model/descriptor_source.hpp"
#include "model/descriptors.hpp"

namespace modgraph::model {

// Name given to the store produced by loadApplications().
inline constexpr const char *kCombinedApplicationName = "all";

class DescriptorLoader {
public:
    DescriptorLoader(const DescriptorSource &source, const modgraph::Context &ctx);

    // Loads name and its extends chain. Throws LoadError subclasses.
    Descriptors loadApplication(const std::string &applicationName) const;

    // Loads each application independently and merges them into one store.
    // A module loaded by two of the applications is a DuplicateModuleError.
    Descriptors loadApplications(const std::vector<std::string> &applicationNames) const;

private:
    struct Accumulator {
        ModuleMap modules;
        std::unordered_map<std::string, std::string> owners;
        std::vector<std::string> chain;
    };

    Descriptors loadInto(const std::string &applicationName, Accumulator &seen) const;
    ModuleSpec readModule(const std::string &moduleName, const std::string &applicationName) const;

    const DescriptorSource &source_;
    const modgraph::Context &ctx_;
};

} // namespace modgraph::model
