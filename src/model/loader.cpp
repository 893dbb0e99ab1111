#include "model/loader.hpp"

#include <algorithm>
#include <optional>
#include <utility>

#include "model/errors.hpp"

using nlohmann::json;

namespace modgraph::model
{

    namespace
    {

        std::vector<std::string> toStringList(
            const json &node,
            const char *key,
            const std::string &origin,
            const std::string &applicationName)
        {
            std::vector<std::string> out;
            if (!node.contains(key) || node[key].is_null())
            {
                return out;
            }

            const json &list = node[key];
            if (!list.is_array())
            {
                throw ParseError("\"" + std::string(key) + "\" of " + origin + " is not an array", origin, applicationName);
            }

            for (const auto &item : list)
            {
                if (!item.is_string())
                {
                    throw ParseError(
                        "\"" + std::string(key) + "\" of " + origin + " contains a non-string entry", origin, applicationName);
                }
                out.push_back(item.get<std::string>());
            }
            return out;
        }

        ModuleSpec parseModuleSpec(json data, const std::string &origin, const std::string &applicationName)
        {
            ModuleSpec module;
            module.name = data["name"].get<std::string>();
            module.dependencies = toStringList(data, "dependencies", origin, applicationName);
            module.resources = toStringList(data, "resources", origin, applicationName);
            module.raw = std::move(data);
            return module;
        }

        ModuleList parseApplicationModules(const json &data, const std::string &applicationName)
        {
            const std::string origin = "application \"" + applicationName + "\"";
            if (!data.contains("modules") || !data["modules"].is_array())
            {
                throw ParseError(origin + " has no \"modules\" array", origin, applicationName);
            }

            ModuleList out;
            for (const auto &entry : data["modules"])
            {
                if (!entry.is_object() || !entry.contains("name") || !entry["name"].is_string())
                {
                    throw ParseError("Module entry without a name in " + origin, origin, applicationName);
                }

                ModuleSpec module = parseModuleSpec(entry, origin, applicationName);
                if (findModule(out, module.name) != nullptr)
                {
                    throw DuplicateModuleError(module.name, applicationName, applicationName);
                }
                out.push_back(std::move(module));
            }
            return out;
        }

        std::optional<std::string> parseExtends(const json &data, const std::string &applicationName)
        {
            if (!data.contains("extends") || data["extends"].is_null())
            {
                return std::nullopt;
            }
            if (!data["extends"].is_string())
            {
                const std::string origin = "application \"" + applicationName + "\"";
                throw ParseError("\"extends\" of " + origin + " is not a string", origin, applicationName);
            }
            std::string parent = data["extends"].get<std::string>();
            if (parent.empty())
            {
                return std::nullopt;
            }
            return parent;
        }

        bool parseWorker(const json &data, const std::string &applicationName)
        {
            if (!data.contains("worker") || data["worker"].is_null())
            {
                return false;
            }
            if (!data["worker"].is_boolean())
            {
                const std::string origin = "application \"" + applicationName + "\"";
                throw ParseError("\"worker\" of " + origin + " is not a boolean", origin, applicationName);
            }
            return data["worker"].get<bool>();
        }

    } // namespace

    DescriptorLoader::DescriptorLoader(const DescriptorSource &source, const modgraph::Context &ctx)
        : source_(source), ctx_(ctx)
    {
    }

    Descriptors DescriptorLoader::loadApplication(const std::string &applicationName) const
    {
        Accumulator seen;
        return loadInto(applicationName, seen);
    }

    Descriptors DescriptorLoader::loadApplications(const std::vector<std::string> &applicationNames) const
    {
        ModuleMap allModules;
        ModuleList allApplication;
        std::unordered_map<std::string, std::string> owners;

        for (const auto &applicationName : applicationNames)
        {
            Accumulator seen;
            Descriptors result = loadInto(applicationName, seen);

            for (auto &item : seen.modules)
            {
                auto previous = owners.find(item.first);
                if (previous != owners.end())
                {
                    throw DuplicateModuleError(item.first, applicationName, previous->second);
                }
                owners.emplace(item.first, seen.owners[item.first]);
                allModules.emplace(item.first, std::move(item.second));
            }
            for (const auto &entry : result.application())
            {
                allApplication.push_back(entry);
            }
        }

        ctx_.trace("Merged ", applicationNames.size(), " applications (", allModules.size(), " modules)");
        return Descriptors(kCombinedApplicationName, std::move(allApplication), std::move(allModules), std::nullopt, false);
    }

    Descriptors DescriptorLoader::loadInto(const std::string &applicationName, Accumulator &seen) const
    {
        if (std::find(seen.chain.begin(), seen.chain.end(), applicationName) != seen.chain.end())
        {
            throw LoadError("Application \"" + applicationName + "\" extends itself", applicationName);
        }
        seen.chain.push_back(applicationName);

        ctx_.trace("Loading application ", applicationName);
        const json data = source_.readApplication(applicationName);
        ModuleList application = parseApplicationModules(data, applicationName);
        std::optional<std::string> extends = parseExtends(data, applicationName);
        const bool worker = parseWorker(data, applicationName);

        if (extends.has_value())
        {
            ctx_.trace("Application ", applicationName, " extends ", *extends);
            loadInto(*extends, seen);
        }

        std::vector<const ModuleSpec *> added;
        added.reserve(application.size());
        for (const auto &entry : application)
        {
            auto owner = seen.owners.find(entry.name);
            if (owner != seen.owners.end())
            {
                throw DuplicateModuleError(entry.name, applicationName, owner->second);
            }

            auto inserted = seen.modules.emplace(entry.name, readModule(entry.name, applicationName));
            seen.owners.emplace(entry.name, applicationName);
            added.push_back(&inserted.first->second);
        }

        for (const ModuleSpec *module : added)
        {
            for (const auto &dep : module->dependencies)
            {
                if (seen.modules.find(dep) == seen.modules.end())
                {
                    throw MissingDependencyError(dep, module->name, applicationName);
                }
            }
        }

        seen.chain.pop_back();
        return Descriptors(applicationName, std::move(application), seen.modules, std::move(extends), worker);
    }

    ModuleSpec DescriptorLoader::readModule(const std::string &moduleName, const std::string &applicationName) const
    {
        json data = source_.readModule(moduleName, applicationName);
        if (!data.is_object())
        {
            const std::string origin = "module \"" + moduleName + "\"";
            throw ParseError(origin + " descriptor is not an object", origin, applicationName);
        }
        data["name"] = moduleName;
        return parseModuleSpec(std::move(data), "module \"" + moduleName + "\"", applicationName);
    }

} // namespace modgraph::model
