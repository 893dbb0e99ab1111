#include "commands/list_command.hpp"

#include "io/file_descriptor_source.hpp"
#include "model/errors.hpp"
#include "model/loader.hpp"

namespace fs = std::filesystem;

namespace modgraph::commands
{

    int runListCommand(const modgraph::Context &ctx, const fs::path &appDir, const std::vector<std::string> &args)
    {
        if (!args.empty())
        {
            ctx.error("Unexpected argument for list: ", args.front());
            return 1;
        }

        const modgraph::io::FileDescriptorSource source(appDir);
        const modgraph::model::DescriptorLoader loader(source, ctx);
        const auto names = source.listApplications();

        ctx.log("Applications:");
        if (names.empty())
        {
            ctx.log("  <none>");
            return 0;
        }

        for (const auto &name : names)
        {
            try
            {
                const auto descriptors = loader.loadApplication(name);
                std::string label = "  " + name + "  (" + std::to_string(descriptors.application().size()) + " modules";
                if (descriptors.extends().has_value())
                {
                    label += ", extends " + *descriptors.extends();
                }
                if (descriptors.worker())
                {
                    label += ", worker";
                }
                ctx.log(label, ")");
            }
            catch (const modgraph::model::DescriptorError &e)
            {
                ctx.log("  ", name, "  [invalid]");
                ctx.trace("    ", e.what());
            }
        }
        return 0;
    }

} // namespace modgraph::commands
