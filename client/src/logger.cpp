#include "vidyeet/client/logger.hpp"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/null_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <iostream>
#include <vector>

namespace vidyeet::client
{

    std::shared_ptr<spdlog::logger> make_logger(const std::optional<std::filesystem::path> &path, bool verbose)
    {
        std::vector<spdlog::sink_ptr> sinks;
        if (path)
        {
            sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(path->string(), true));
        }
        if (verbose)
        {
            auto console = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
            console->set_pattern("%Y-%m-%d %H:%M:%S [%^%l%$] %v");
            sinks.push_back(std::move(console));
        }
        if (sinks.empty())
        {
            sinks.push_back(std::make_shared<spdlog::sinks::null_sink_mt>());
        }
        auto logger = std::make_shared<spdlog::logger>("vidyeet", sinks.begin(), sinks.end());
        if (path)
        {
            sinks.front()->set_pattern("%Y-%m-%d %H:%M:%S [%l] %v");
        }
        logger->set_level(verbose ? spdlog::level::debug : spdlog::level::info);
        return logger;
    }

    void install_logger(const std::optional<std::filesystem::path> &path, bool verbose)
    {
        try
        {
            spdlog::set_default_logger(make_logger(path, verbose));
        }
        catch (const spdlog::spdlog_ex &ex)
        {
            std::cerr << "WARNING: logging disabled: " << ex.what() << std::endl;
            spdlog::set_default_logger(std::make_shared<spdlog::logger>(
                "vidyeet", std::make_shared<spdlog::sinks::null_sink_mt>()));
        }
    }

} // namespace vidyeet::client
