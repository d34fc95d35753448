#pragma once

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace lens::utils
{
    /**
     * @brief Name of a per-run log file, `<UTC timestamp>-<stem>.log`.
     *
     * The timestamp is basic ISO 8601 (`20240102T030405Z`), so names sort by start time
     * and hold no characters that are illegal in file names.
     */
    std::string logFileName(std::string_view stem, std::chrono::system_clock::time_point started_at = std::chrono::system_clock::now());

    /**
     * @brief Installs the default logger: a stderr console sink and, when `logs_path`
     * is set, a debug-level file sink inside it.
     *
     * stdout is left to the decoded records. A logs directory that cannot be created
     * or a file that cannot be opened is reported and the logger falls back to the console.
     *
     * @return true when the file sink is active.
     */
    bool configureLogger(const std::optional<std::filesystem::path> & logs_path, bool verbose);
}
