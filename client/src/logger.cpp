#include "filepipe/client/logger.hpp"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/null_sink.h>

#include <iostream>
#include <vector>

namespace filepipe::client
{

    Logger::Logger(const std::optional<std::filesystem::path> &path, spdlog::level::level_enum level)
    {
        std::vector<spdlog::sink_ptr> sinks;
        if (path)
        {
            try
            {
                sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(path->string(), true));
            }
            catch (const spdlog::spdlog_ex &ex)
            {
                std::cerr << "Could not open log file " << path->string() << ": " << ex.what() << std::endl;
            }
        }
        if (sinks.empty())
        {
            sinks.push_back(std::make_shared<spdlog::sinks::null_sink_mt>());
        }
        logger_ = std::make_shared<spdlog::logger>("client", sinks.begin(), sinks.end());
        logger_->set_pattern("%Y-%m-%d %H:%M:%S [%l] %v");
        logger_->set_level(level);
    }

    void Logger::set_level(spdlog::level::level_enum level)
    {
        logger_->set_level(level);
    }

} // namespace filepipe::client
