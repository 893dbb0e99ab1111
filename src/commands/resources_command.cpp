#include "commands/resources_command.hpp"

#include "io/file_descriptor_source.hpp"
#include "model/errors.hpp"
#include "model/loader.hpp"

namespace fs = std::filesystem;

namespace modgraph::commands
{

    int runResourcesCommand(const modgraph::Context &ctx, const fs::path &appDir, const std::vector<std::string> &args)
    {
        if (args.size() != 2)
        {
            ctx.error("Usage: resources <application> <module>");
            return 1;
        }

        const modgraph::io::FileDescriptorSource source(appDir);
        const modgraph::model::DescriptorLoader loader(source, ctx);
        try
        {
            const auto descriptors = loader.loadApplication(args[0]);
            for (const auto &resource : descriptors.resourceList(args[1]))
            {
                ctx.log(resource);
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
