#include "ftecho/client/logger.hpp"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/null_sink.h>

#include <iostream>
#include <vector>

namespace ftecho::client
{

    Logger::Logger(const std::optional<std::filesystem::path> &path)
    {
        try
        {
            std::vector<spdlog::sink_ptr> sinks;
            if (path)
            {
                sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(path->string(), false));
            }
            else
            {
                sinks.push_back(std::make_shared<spdlog::sinks::null_sink_mt>());
            }
            logger_ = std::make_shared<spdlog::logger>("client", sinks.begin(), sinks.end());
            logger_->set_pattern("%Y-%m-%d %H:%M:%S [%l] %v");
            logger_->set_level(spdlog::level::info);
            logger_->flush_on(spdlog::level::info);
        }
        catch (const spdlog::spdlog_ex &ex)
        {
            std::cerr << "[warning] client logging disabled: " << ex.what() << std::endl;
            logger_.reset();
        }
    }

} // namespace ftecho::client
