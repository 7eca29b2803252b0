#include "ferry/client/logger.hpp"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/null_sink.h>

#include <iostream>
#include <vector>

namespace ferry::client
{

    Logger::Logger(const std::optional<std::filesystem::path> &path)
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
                std::cerr << "[warning] cannot open log file: " << ex.what() << std::endl;
            }
        }
        if (sinks.empty())
        {
            sinks.push_back(std::make_shared<spdlog::sinks::null_sink_mt>());
        }
        logger_ = std::make_shared<spdlog::logger>("client", sinks.begin(), sinks.end());
        logger_->set_pattern("%Y-%m-%d %H:%M:%S [%l] %v");
        logger_->set_level(path ? spdlog::level::debug : spdlog::level::info);
        spdlog::set_default_logger(logger_);
    }

} // namespace ferry::client
