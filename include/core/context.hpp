#pragma once

#include <iostream>

namespace modgraph {

class Context {
public:
    explicit Context(bool verbose = true) : verbose_(verbose) {}

    template <typename... Args>
    void log(const Args &...args) const {
        (std::cout << ... << args) << '\n';
    }

    // Progress output; only printed when verbose, kept off stdout.
    template <typename... Args>
    void trace(const Args &...args) const {
        if (!verbose_) {
            return;
        }
        (std::cerr << ... << args) << '\n';
    }

    template <typename... Args>
    void warn(const Args &...args) const {
        std::cerr << "[warn] ";
        (std::cerr << ... << args) << '\n';
    }

    template <typename... Args>
    void error(const Args &...args) const {
        std::cerr << "[error] ";
        (std::cerr << ... << args) << '\n';
    }

    bool verbose() const { return verbose_; }

private:
    bool verbose_;
};

} // namespace modgraph
