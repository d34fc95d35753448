#include "utils.hpp"

#include <format>
#include <memory>
#include <system_error>
#include <vector>

#include <spdlog/spdlog.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace lens::utils
{
    std::string logFileName(std::string_view stem, std::chrono::system_clock::time_point started_at)
    {
        const auto seconds = std::chrono::floor<std::chrono::seconds>(started_at);
        return std::format("{:%Y%m%dT%H%M%SZ}-{}.log", seconds, stem);
    }

    bool configureLogger(const std::optional<std::filesystem::path> & logs_path, bool verbose)
    {
        auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
        console_sink->set_level(verbose ? spdlog::level::debug : spdlog::level::info);
        console_sink->set_pattern("[%T] [%^%l%$] %v");

        std::vector<spdlog::sink_ptr> sinks{console_sink};

        std::string file_sink_error;
        if(logs_path)
        {
            std::error_code ec;
            std::filesystem::create_directories(*logs_path, ec);
            if(ec)
            {
                file_sink_error = std::format("Cannot create logs directory {}: {}", logs_path->string(), ec.message());
            }
            else
            {
                try
                {
                    auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(
                        (*logs_path / logFileName("DecodeEvent")).string(), true);
                    file_sink->set_level(spdlog::level::debug);
                    file_sink->set_pattern("[%Y-%m-%d %H:%M:%S] [%l] %v");
                    sinks.push_back(file_sink);
                }
                catch(const spdlog::spdlog_ex & e)
                {
                    file_sink_error = std::format("Cannot open log file in {}: {}", logs_path->string(), e.what());
                }
            }
        }

        const bool file_sink_active = sinks.size() > 1;

        auto logger = std::make_shared<spdlog::logger>("multi_sink", sinks.begin(), sinks.end());
        logger->set_level(spdlog::level::debug);
        logger->flush_on(spdlog::level::info);

        spdlog::set_default_logger(logger);

        if(!file_sink_error.empty())
        {
            spdlog::warn("{}, logging to the console only", file_sink_error);
        }

        return file_sink_active;
    }
}
