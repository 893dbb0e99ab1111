#include "model/config.hpp"

#include <system_error>

#include "io/json_reader.hpp"
#include "model/errors.hpp"

namespace fs = std::filesystem;
using nlohmann::json;

namespace modgraph::model
{

    namespace
    {

        std::vector<std::string> toStringList(const json &node)
        {
            std::vector<std::string> out;
            if (!node.is_array())
            {
                return out;
            }

            for (const auto &item : node)
            {
                if (!item.is_string())
                {
                    continue;
                }
                std::string value = item.get<std::string>();
                if (!value.empty())
                {
                    out.push_back(value);
                }
            }
            return out;
        }

    } // namespace

    BuildConfig loadBuildConfig(const fs::path &appDir, const modgraph::Context &ctx)
    {
        BuildConfig config;
        fs::path configPath = appDir / "config.json";
        std::error_code ec;
        if (!fs::exists(configPath, ec))
        {
            return config;
        }

        try
        {
            json data = io::loadJsonFile(configPath);
            json root = data;
            if (data.contains("Configuration") && data["Configuration"].is_object())
            {
                root = data["Configuration"];
            }

            config.applications = toStringList(root.value("Applications", json::array()));

            if (root.contains("Output") && root["Output"].is_string())
            {
                fs::path output(root["Output"].get<std::string>());
                if (!output.empty())
                {
                    config.outputDir = output.is_absolute() ? output : fs::absolute(appDir / output);
                }
            }
        }
        catch (const DescriptorError &e)
        {
            ctx.warn("Ignoring ", configPath.string(), " : ", e.what());
            return BuildConfig{};
        }

        return config;
    }

} // namespace modgraph::model
