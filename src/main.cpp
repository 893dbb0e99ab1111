#include <cstddef>
#include <filesystem>
#include <iostream>
#include <string>
#include <system_error>
#include <vector>

#include "commands/closure_command.hpp"
#include "commands/global_options.hpp"
#include "commands/list_command.hpp"
#include "commands/manifest_command.hpp"
#include "commands/order_command.hpp"
#include "commands/resources_command.hpp"
#include "core/context.hpp"

namespace fs = std::filesystem;

namespace
{

    constexpr const char *kAppName = "modgraph";
    constexpr const char *kVersionLine = "module descriptor resolver 1.0";

    void printHelp()
    {
        std::cout << kAppName << " - " << kVersionLine << "\n"
                  << "\n"
                  << "Usage:\n"
                  << "  " << kAppName << " [--dir PATH] [--verbose] order [application...]\n"
                  << "  " << kAppName << " [--dir PATH] [--verbose] closure <application> <module>\n"
                  << "  " << kAppName << " [--dir PATH] [--verbose] resources <application> <module>\n"
                  << "  " << kAppName << " [--dir PATH] [--verbose] manifest <application> [--out FILE]\n"
                  << "  " << kAppName << " [--dir PATH] [--verbose] list\n"
                  << "\n"
                  << "Examples:\n"
                  << "  " << kAppName << " order devtools_app\n"
                  << "  " << kAppName << " order inspector worker_app\n"
                  << "  " << kAppName << " closure devtools_app elements\n"
                  << "  " << kAppName << " manifest devtools_app --out out/devtools_app.json\n";
    }

    fs::path detectApplicationDir()
    {
        std::error_code ec;
        fs::path cwd = fs::current_path(ec);
        if (ec)
        {
            return fs::path(".");
        }

        fs::path probe = cwd;
        for (int i = 0; i < 8; ++i)
        {
            std::error_code probeEc;
            if (fs::is_directory(probe / "entrypoints", probeEc))
            {
                return probe;
            }
            if (!probe.has_parent_path() || probe.parent_path() == probe)
            {
                break;
            }
            probe = probe.parent_path();
        }
        return cwd;
    }

} // namespace

int main(int argc, char **argv)
{
    const std::vector<std::string> args(argv + 1, argv + argc);
    modgraph::commands::GlobalOptions options;
    if (!modgraph::commands::parseGlobalOptions(args, options, modgraph::Context(false)))
    {
        return 1;
    }
    if (options.commandIndex >= args.size())
    {
        printHelp();
        return 1;
    }

    const std::string &command = args[options.commandIndex];
    const modgraph::Context ctx(options.verbose);
    const fs::path appDir = options.appDir.empty() ? detectApplicationDir() : options.appDir;
    const std::vector<std::string> rest(args.begin() + static_cast<std::ptrdiff_t>(options.commandIndex) + 1, args.end());

    if (command == "help" || command == "--help" || command == "-h")
    {
        printHelp();
        return 0;
    }
    if (command == "version" || command == "--version" || command == "-v")
    {
        std::cout << kAppName << " - " << kVersionLine << '\n';
        return 0;
    }

    if (command == "order")
    {
        return modgraph::commands::runOrderCommand(ctx, appDir, rest);
    }
    if (command == "closure")
    {
        return modgraph::commands::runClosureCommand(ctx, appDir, rest);
    }
    if (command == "resources")
    {
        return modgraph::commands::runResourcesCommand(ctx, appDir, rest);
    }
    if (command == "manifest")
    {
        return modgraph::commands::runManifestCommand(ctx, appDir, rest);
    }
    if (command == "list")
    {
        return modgraph::commands::runListCommand(ctx, appDir, rest);
    }

    std::cerr << "Unknown command: " << command << '\n';
    printHelp();
    return 1;
}
