#include "model/errors.hpp"

namespace modgraph::model
{

    DuplicateModuleError::DuplicateModuleError(std::string module, std::string application, std::string previousApplication)
        : LoadError("Duplicate definition of module \"" + module + "\" in application \"" + application +
                        "\" (already defined by \"" + previousApplication + "\")",
                    application),
          module_(std::move(module)),
          previousApplication_(std::move(previousApplication))
    {
    }

    MissingDependencyError::MissingDependencyError(std::string dependency, std::string module, std::string application)
        : LoadError("Module \"" + dependency + "\" (dependency of \"" + module +
                        "\") not listed in application descriptor \"" + application + "\"",
                    application),
          dependency_(std::move(dependency)),
          module_(std::move(module))
    {
    }

    CycleError::CycleError(std::string module)
        : GraphError("Dependency cycle found at module \"" + module + "\""),
          module_(std::move(module))
    {
    }

    UnknownModuleError::UnknownModuleError(std::string module, std::string referencedBy)
        : GraphError("Unknown module \"" + module + "\" encountered in dependencies of \"" + referencedBy + "\""),
          module_(std::move(module)),
          referencedBy_(std::move(referencedBy))
    {
    }

    LookupError::LookupError(std::string module, const std::string &application)
        : DescriptorError("Module \"" + module + "\" not found in application \"" + application + "\""),
          module_(std::move(module))
    {
    }

} // namespace modgraph::model
