#include "io/json_reader.hpp"

#include <fstream>
#include <system_error>

#include "model/errors.hpp"

namespace modgraph::io
{

    nlohmann::json loadJsonFile(const std::filesystem::path &path)
    {
        std::error_code ec;
        if (!std::filesystem::is_regular_file(path, ec))
        {
            throw model::NotFoundError("JSON file not found: " + path.string(), path.string());
        }

        std::ifstream in(path);
        if (!in.is_open())
        {
            throw model::NotFoundError("Could not open JSON file: " + path.string(), path.string());
        }

        nlohmann::json data;
        try
        {
            in >> data;
        }
        catch (const nlohmann::json::parse_error &e)
        {
            throw model::ParseError("Failed to parse " + path.string() + " : " + e.what(), path.string());
        }
        if (!data.is_object())
        {
            throw model::ParseError("JSON root is not object: " + path.string(), path.string());
        }
        return data;
    }

} // namespace modgraph::io
