#include "commands/manifest_command.hpp"

#include "io/file_descriptor_source.hpp"
#include "io/fs_utils.hpp"
#include "model/config.hpp"
#include "model/errors.hpp"
#include "model/loader.hpp"

namespace fs = std::filesystem;

namespace modgraph::commands
{
    namespace
    {

        struct ManifestOptions
        {
            std::string application;
            std::string outFile;
        };

        bool parseManifestOptions(const std::vector<std::string> &args, ManifestOptions &opt, const modgraph::Context &ctx)
        {
            for (std::size_t i = 0; i < args.size(); ++i)
            {
                const std::string &arg = args[i];
                if (arg == "--out")
                {
                    if (i + 1 >= args.size())
                    {
                        ctx.error("--out requires value");
                        return false;
                    }
                    opt.outFile = args[++i];
                    continue;
                }
                if (arg.rfind("--", 0) == 0)
                {
                    ctx.error("Unknown option for manifest: ", arg);
                    return false;
                }
                if (!opt.application.empty())
                {
                    ctx.error("Unexpected argument: ", arg);
                    return false;
                }
                opt.application = arg;
            }

            if (opt.application.empty())
            {
                ctx.error("Usage: manifest <application> [--out FILE]");
                return false;
            }
            return true;
        }

    } // namespace

    int runManifestCommand(const modgraph::Context &ctx, const fs::path &appDir, const std::vector<std::string> &args)
    {
        ManifestOptions opt;
        if (!parseManifestOptions(args, opt, ctx))
        {
            return 1;
        }

        const modgraph::io::FileDescriptorSource source(appDir);
        const modgraph::model::DescriptorLoader loader(source, ctx);
        std::string content;
        try
        {
            content = loader.loadApplication(opt.application).applicationManifest().dump(2);
        }
        catch (const modgraph::model::DescriptorError &e)
        {
            ctx.error(e.what());
            return 1;
        }

        fs::path target;
        if (!opt.outFile.empty())
        {
            target = fs::path(opt.outFile);
            if (!target.is_absolute())
            {
                target = fs::absolute(appDir / target);
            }
        }
        else
        {
            const auto config = modgraph::model::loadBuildConfig(appDir, ctx);
            if (!config.outputDir.empty())
            {
                target = config.outputDir / (opt.application + ".json");
            }
        }

        if (target.empty())
        {
            ctx.log(content);
            return 0;
        }
        if (!modgraph::io::writeTextFile(target, content + "\n", ctx))
        {
            return 1;
        }
        ctx.trace("Wrote ", target.string());
        return 0;
    }

} // namespace modgraph::commands
