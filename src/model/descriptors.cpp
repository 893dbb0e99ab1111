#include "model/descriptors.hpp"

#include <utility>

#include "model/errors.hpp"

using nlohmann::json;

namespace modgraph::model
{

    Descriptors::Descriptors(
        std::string applicationName,
        ModuleList application,
        ModuleMap modules,
        std::optional<std::string> extends,
        bool worker)
        : applicationName_(std::move(applicationName)),
          application_(std::move(application)),
          modules_(std::move(modules)),
          extends_(std::move(extends)),
          worker_(worker)
    {
    }

    std::vector<std::string> Descriptors::resourceList(const std::string &moduleName) const
    {
        auto it = modules_.find(moduleName);
        if (it == modules_.end())
        {
            throw LookupError(moduleName, applicationName_);
        }

        std::vector<std::string> out;
        out.reserve(it->second.resources.size());
        for (const auto &resource : it->second.resources)
        {
            out.push_back(moduleName + "/" + resource);
        }
        return out;
    }

    json Descriptors::applicationManifest() const
    {
        json entries = json::array();
        for (const auto &module : application_)
        {
            entries.push_back(module.raw);
        }

        json result = json::object();
        result["modules"] = std::move(entries);
        return result;
    }

    const std::vector<std::string> &Descriptors::topologicalOrder() const
    {
        if (sortedModules_.has_value())
        {
            return *sortedModules_;
        }

        std::vector<std::string> ordered;
        ordered.reserve(modules_.size());
        std::unordered_map<std::string, Mark> marks;

        for (const auto &item : modules_)
        {
            if (marks.count(item.first) == 0U)
            {
                visitSorted(item.first, std::string(), marks, ordered);
            }
        }

        sortedModules_ = std::move(ordered);
        return *sortedModules_;
    }

    void Descriptors::visitSorted(
        const std::string &name,
        const std::string &referencedBy,
        std::unordered_map<std::string, Mark> &marks,
        std::vector<std::string> &ordered) const
    {
        auto mark = marks.find(name);
        if (mark != marks.end())
        {
            if (mark->second == Mark::InProgress)
            {
                throw CycleError(name);
            }
            return;
        }

        auto it = modules_.find(name);
        if (it == modules_.end())
        {
            // Roots always come from modules_, so referencedBy is set here.
            throw UnknownModuleError(name, referencedBy);
        }

        marks.emplace(name, Mark::InProgress);
        for (const auto &dep : it->second.dependencies)
        {
            visitSorted(dep, name, marks, ordered);
        }
        marks[name] = Mark::Done;
        ordered.push_back(name);
    }

    std::vector<std::string> Descriptors::dependencyClosure(const std::string &moduleName) const
    {
        if (modules_.find(moduleName) == modules_.end())
        {
            throw LookupError(moduleName, applicationName_);
        }

        std::vector<std::string> ordered;
        std::unordered_set<std::string> active;
        std::unordered_set<std::string> visited;
        visitClosure(moduleName, active, visited, ordered);
        return ordered;
    }

    void Descriptors::visitClosure(
        const std::string &name,
        std::unordered_set<std::string> &active,
        std::unordered_set<std::string> &visited,
        std::vector<std::string> &ordered) const
    {
        if (visited.count(name) != 0U)
        {
            return;
        }
        if (active.count(name) != 0U)
        {
            throw CycleError(name);
        }

        const auto &module = modules_.at(name);
        active.insert(name);
        for (const auto &dep : module.dependencies)
        {
            if (modules_.find(dep) == modules_.end())
            {
                throw UnknownModuleError(dep, name);
            }
            visitClosure(dep, active, visited, ordered);
        }
        active.erase(name);

        visited.insert(name);
        ordered.push_back(name);
    }

} // namespace modgraph::model
