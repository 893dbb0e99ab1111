#pragma once

#include <stdexcept>
#include <string>
#include <utility>

namespace modgraph::model {

class DescriptorError : public std::runtime_error {
public:
    explicit DescriptorError(const std::string &message) : std::runtime_error(message) {}
};

// Raised while reading and validating descriptors.
class LoadError : public DescriptorError {
public:
    LoadError(const std::string &message, std::string application)
        : DescriptorError(message), application_(std::move(application)) {}

    const std::string &application() const { return application_; }

private:
    std::string application_;
};

class NotFoundError : public LoadError {
public:
    NotFoundError(const std::string &message, std::string resource, std::string application = {})
        : LoadError(message, std::move(application)), resource_(std::move(resource)) {}

    const std::string &resource() const { return resource_; }

private:
    std::string resource_;
};

class ParseError : public LoadError {
public:
    ParseError(const std::string &message, std::string resource, std::string application = {})
        : LoadError(message, std::move(application)), resource_(std::move(resource)) {}

    const std::string &resource() const { return resource_; }

private:
    std::string resource_;
};

class DuplicateModuleError : public LoadError {
public:
    DuplicateModuleError(std::string module, std::string application, std::string previousApplication);

    const std::string &module() const { return module_; }
    const std::string &previousApplication() const { return previousApplication_; }

private:
    std::string module_;
    std::string previousApplication_;
};

class MissingDependencyError : public LoadError {
public:
    MissingDependencyError(std::string dependency, std::string module, std::string application);

    const std::string &dependency() const { return dependency_; }
    const std::string &module() const { return module_; }

private:
    std::string dependency_;
    std::string module_;
};

// Raised by graph queries on a loaded store.
class GraphError : public DescriptorError {
public:
    explicit GraphError(const std::string &message) : DescriptorError(message) {}
};

class CycleError : public GraphError {
public:
    explicit CycleError(std::string module);

    const std::string &module() const { return module_; }

private:
    std::string module_;
};

class UnknownModuleError : public GraphError {
public:
    UnknownModuleError(std::string module, std::string referencedBy);

    const std::string &module() const { return module_; }
    const std::string &referencedBy() const { return referencedBy_; }

private:
    std::string module_;
    std::string referencedBy_;
};

class LookupError : public DescriptorError {
public:
    LookupError(std::string module, const std::string &application);

    const std::string &module() const { return module_; }

private:
    std::string module_;
};

} // namespace modgraph::model
