#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "model/descriptor_source.hpp"

namespace modgraph::io {

// Reads <dir>/entrypoints/<app>/<app>.json and <dir>/<module>/module.json.
class FileDescriptorSource : public model::DescriptorSource {
public:
    explicit FileDescriptorSource(std::filesystem::path applicationDir);

    nlohmann::json readApplication(const std::string &applicationName) const override;
    nlohmann::json readModule(const std::string &moduleName, const std::string &applicationName) const override;

    std::filesystem::path applicationFile(const std::string &applicationName) const;
    std::filesystem::path moduleFile(const std::string &moduleName) const;

    std::vector<std::string> listApplications() const;

private:
    std::filesystem::path applicationDir_;
};

} // namespace modgraph::io
