#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "vidyeet/settings.hpp"

namespace vidyeet::client
{

    enum class Command
    {
        Login,
        Logout,
        Status,
        List,
        Show,
        Delete,
        Upload,
        Help,
        Version
    };

    struct ClientConfig
    {
        Command command{Command::Help};
        std::vector<std::string> positional;
        bool machine_output{false};
        bool verbose{false};
        std::optional<std::filesystem::path> log_path;

        // login
        bool credentials_from_stdin{false};
        // delete
        bool force{false};
        // upload
        bool show_progress{false};
        std::optional<std::uint64_t> chunk_size_mib;
        std::optional<std::string> title;
        std::optional<std::uint32_t> timeout_seconds;
        bool no_reclaim{false};
        std::optional<std::uint32_t> progress_interval_seconds;
    };

    // Throws Error(InvalidConfiguration) on malformed command lines.
    ClientConfig parse_arguments(int argc, char *argv[]);

    // Looks for --machine before full parsing so usage errors can be reported in the right format.
    bool wants_machine_output(int argc, char *argv[]);

    // Folds command-line overrides and the stored default title into the upload settings.
    void apply_upload_overrides(const ClientConfig &config, const std::optional<std::string> &default_title,
                                UploadSettings &settings);

} // namespace vidyeet::client
