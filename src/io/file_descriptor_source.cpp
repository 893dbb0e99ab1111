#include "io/file_descriptor_source.hpp"

#include <system_error>
#include <utility>

#include "io/fs_utils.hpp"
#include "io/json_reader.hpp"
#include "model/errors.hpp"

namespace fs = std::filesystem;

namespace modgraph::io
{

    FileDescriptorSource::FileDescriptorSource(fs::path applicationDir)
        : applicationDir_(std::move(applicationDir))
    {
    }

    fs::path FileDescriptorSource::applicationFile(const std::string &applicationName) const
    {
        return applicationDir_ / "entrypoints" / applicationName / (applicationName + ".json");
    }

    fs::path FileDescriptorSource::moduleFile(const std::string &moduleName) const
    {
        return applicationDir_ / moduleName / "module.json";
    }

    nlohmann::json FileDescriptorSource::readApplication(const std::string &applicationName) const
    {
        const fs::path file = applicationFile(applicationName);
        std::error_code ec;
        if (!fs::exists(file, ec))
        {
            throw model::NotFoundError(
                "Application descriptor " + file.string() + " is missing", file.string(), applicationName);
        }

        try
        {
            return loadJsonFile(file);
        }
        catch (const model::ParseError &e)
        {
            throw model::ParseError(e.what(), e.resource(), applicationName);
        }
    }

    nlohmann::json FileDescriptorSource::readModule(const std::string &moduleName, const std::string &applicationName) const
    {
        const fs::path file = moduleFile(moduleName);
        std::error_code ec;
        if (!fs::exists(file, ec))
        {
            throw model::NotFoundError(
                "Module descriptor " + file.string() + " referenced in " + applicationFile(applicationName).string() + " is missing",
                file.string(),
                applicationName);
        }

        try
        {
            return loadJsonFile(file);
        }
        catch (const model::ParseError &e)
        {
            throw model::ParseError(e.what(), e.resource(), applicationName);
        }
    }

    std::vector<std::string> FileDescriptorSource::listApplications() const
    {
        std::vector<std::string> out;
        for (const auto &file : listEntrypointFiles(applicationDir_))
        {
            out.push_back(file.stem().string());
        }
        return out;
    }

} // namespace modgraph::io
