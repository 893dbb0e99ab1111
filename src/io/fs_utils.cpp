#include "io/fs_utils.hpp"

#include <algorithm>
#include <fstream>
#include <system_error>

namespace fs = std::filesystem;

namespace modgraph::io
{

    bool ensureDir(const fs::path &path)
    {
        if (path.empty())
        {
            return true;
        }
        std::error_code ec;
        if (fs::exists(path, ec))
        {
            return fs::is_directory(path, ec);
        }
        return fs::create_directories(path, ec) && !ec;
    }

    bool writeTextFile(const fs::path &file, const std::string &content, const modgraph::Context &ctx)
    {
        std::error_code ec;
        if (fs::exists(file, ec))
        {
            if (!fs::remove(file, ec) || ec)
            {
                ctx.error("Failed remove ", file.string(), " : ", ec.message());
                return false;
            }
        }

        if (!ensureDir(file.parent_path()))
        {
            ctx.error("Failed create directory: ", file.parent_path().string());
            return false;
        }

        std::ofstream out(file, std::ios::binary | std::ios::trunc);
        if (!out.is_open())
        {
            ctx.error("Failed write file: ", file.string());
            return false;
        }
        out << content;
        out.close();
        if (!out)
        {
            ctx.error("Failed write file: ", file.string());
            return false;
        }
        return true;
    }

    std::vector<fs::path> listEntrypointFiles(const fs::path &appDir)
    {
        std::vector<fs::path> out;
        const fs::path root = appDir / "entrypoints";
        std::error_code ec;
        if (!fs::exists(root, ec))
        {
            return out;
        }

        for (fs::directory_iterator it(root, ec), end; !ec && it != end; it.increment(ec))
        {
            std::error_code entryEc;
            if (!it->is_directory(entryEc))
            {
                continue;
            }
            const std::string name = it->path().filename().string();
            fs::path file = it->path() / (name + ".json");
            std::error_code fileEc;
            if (fs::is_regular_file(file, fileEc))
            {
                out.push_back(file);
            }
        }

        std::sort(out.begin(), out.end());
        return out;
    }

} // namespace modgraph::io
