#include "commands/order_command.hpp"

#include "io/file_descriptor_source.hpp"
#include "model/config.hpp"
#include "model/errors.hpp"
#include "model/loader.hpp"

namespace fs = std::filesystem;

namespace modgraph::commands
{

    int runOrderCommand(const modgraph::Context &ctx, const fs::path &appDir, const std::vector<std::string> &args)
    {
        std::vector<std::string> names;
        for (const auto &arg : args)
        {
            if (arg.rfind("--", 0) == 0)
            {
                ctx.error("Unknown option for order: ", arg);
                return 1;
            }
            names.push_back(arg);
        }

        if (names.empty())
        {
            names = modgraph::model::loadBuildConfig(appDir, ctx).applications;
        }
        if (names.empty())
        {
            ctx.error("Usage: order <application> [application...] (or set Applications in config.json)");
            return 1;
        }

        const modgraph::io::FileDescriptorSource source(appDir);
        const modgraph::model::DescriptorLoader loader(source, ctx);
        try
        {
            const auto descriptors =
                names.size() == 1 ? loader.loadApplication(names.front()) : loader.loadApplications(names);
            for (const auto &name : descriptors.topologicalOrder())
            {
                ctx.log(name);
            }
        }
        catch (const modgraph::model::DescriptorError &e)
        {
            ctx.error(e.what());
            return 1;
        }
        return 0;
    }

} // namespace modgraph::commands
