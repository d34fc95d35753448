#include "file.hpp"

#include <format>
#include <fstream>
#include <sstream>
#include <system_error>

#include <spdlog/spdlog.h>

#include "parser.hpp"

namespace lens::file
{
    std::optional<std::string> loadParameters(const std::filesystem::path & path, PayloadFormat format)
    {
        std::error_code ec;
        if(!std::filesystem::is_regular_file(path, ec))
        {
            spdlog::error(std::format("Parameters file {} does not exist or is not a file", path.string()));
            return std::nullopt;
        }

        std::ifstream file(path, std::ios::in | std::ios::binary);
        if(!file.is_open())
        {
            spdlog::error(std::format("Failed to open parameters file {}", path.string()));
            return std::nullopt;
        }

        std::ostringstream content;
        content << file.rdbuf();
        if(file.bad())
        {
            spdlog::error(std::format("Failed to read parameters file {}", path.string()));
            return std::nullopt;
        }

        std::string text = content.str();
        if(text.empty())
        {
            spdlog::error(std::format("Parameters file {} is empty", path.string()));
            return std::nullopt;
        }

        spdlog::debug("Loaded {} bytes of parameters from {}", text.size(), path.string());

        switch(format)
        {
            case PayloadFormat::RAW_ABI: return json{{"abi", std::move(text)}}.dump();
            case PayloadFormat::PARAMETERS: return text;
        }
        return std::nullopt;
    }
}
