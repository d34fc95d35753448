#pragma once

#include <filesystem>
#include <optional>
#include <string>

namespace lens::file
{
    enum class PayloadFormat
    {
        PARAMETERS = 0,
        RAW_ABI
    };

    /**
     * @brief Reads the module parameters from disk.
     *
     * A PARAMETERS file already holds the `{"abi": "..."}` payload and is returned as is.
     * A RAW_ABI file holds the contract ABI itself and is wrapped into that payload.
     * Missing, unreadable and empty files are logged and yield nullopt.
     */
    std::optional<std::string> loadParameters(const std::filesystem::path & path, PayloadFormat format);
}
