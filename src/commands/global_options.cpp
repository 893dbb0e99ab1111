#include "commands/global_options.hpp"

namespace fs = std::filesystem;

namespace modgraph::commands
{

    bool parseGlobalOptions(const std::vector<std::string> &args, GlobalOptions &opt, const modgraph::Context &ctx)
    {
        std::size_t i = 0;
        for (; i < args.size(); ++i)
        {
            const std::string &arg = args[i];
            if (arg == "--dir")
            {
                if (i + 1 >= args.size() || args[i + 1].empty())
                {
                    ctx.error("--dir requires value");
                    return false;
                }
                opt.appDir = fs::absolute(args[++i]);
                continue;
            }
            if (arg == "--verbose")
            {
                opt.verbose = true;
                continue;
            }
            break;
        }
        opt.commandIndex = i;
        return true;
    }

} // namespace modgraph::commands
