#pragma once

#include <string>

#include "nlohmann/json.hpp"

namespace modgraph::model {

// Supplies parsed descriptor documents to the loader. Implementations throw
// NotFoundError for a missing resource and ParseError for one that is not a
// JSON object.
class DescriptorSource {
public:
    virtual ~DescriptorSource() = default;

    virtual nlohmann::json readApplication(const std::string &applicationName) const = 0;
    virtual nlohmann::json readModule(const std::string &moduleName, const std::string &applicationName) const = 0;
};

} // namespace modgraph::model
