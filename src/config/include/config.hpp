#pragma once
#include <filesystem>
#include <optional>

namespace lens::config
{
    struct Config
    {
        std::filesystem::path bin_path;
        std::optional<std::filesystem::path> logs_path;
    };
}
