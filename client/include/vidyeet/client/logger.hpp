#pragma once

#include <filesystem>
#include <memory>
#include <optional>

#include <spdlog/logger.h>

namespace vidyeet::client
{

    // Builds the "vidyeet" logger: a file sink with --log, a stderr sink with --verbose, otherwise nothing.
    std::shared_ptr<spdlog::logger> make_logger(const std::optional<std::filesystem::path> &path, bool verbose);

    // Installs the logger as the spdlog default so library code logs through it.
    void install_logger(const std::optional<std::filesystem::path> &path, bool verbose);

} // namespace vidyeet::client
