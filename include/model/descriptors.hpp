#pragma once

#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "model/specs.hpp"

namespace modgraph::model {

// Module graph of one application (or of a merged batch). Immutable once
// constructed; the topological order is computed on first request and kept.
class Descriptors {
public:
    Descriptors(
        std::string applicationName,
        ModuleList application,
        ModuleMap modules,
        std::optional<std::string> extends,
        bool worker
    );

    const std::string &applicationName() const { return applicationName_; }
    const ModuleList &application() const { return application_; }
    const ModuleMap &modules() const { return modules_; }
    const std::optional<std::string> &extends() const { return extends_; }
    bool worker() const { return worker_; }

    // Resource fragments of moduleName prefixed with "<moduleName>/".
    std::vector<std::string> resourceList(const std::string &moduleName) const;

    // {"modules": [...]} over the application's own entries.
    nlohmann::json applicationManifest() const;

    // Every module once, dependencies before dependents.
    const std::vector<std::string> &topologicalOrder() const;

    // moduleName and its transitive dependencies, dependencies first.
    std::vector<std::string> dependencyClosure(const std::string &moduleName) const;

private:
    enum class Mark { InProgress, Done };

    void visitSorted(
        const std::string &name,
        const std::string &referencedBy,
        std::unordered_map<std::string, Mark> &marks,
        std::vector<std::string> &ordered
    ) const;

    void visitClosure(
        const std::string &name,
        std::unordered_set<std::string> &active,
        std::unordered_set<std::string> &visited,
        std::vector<std::string> &ordered
    ) const;

    std::string applicationName_;
    ModuleList application_;
    ModuleMap modules_;
    std::optional<std::string> extends_;
    bool worker_ = false;

    mutable std::optional<std::vector<std::string>> sortedModules_;
};

} // namespace modgraph::model
