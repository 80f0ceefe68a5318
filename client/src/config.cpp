#include "vidyeet/client/config.hpp"

#include <charconv>
#include <string_view>

#include "vidyeet/error_codes.hpp"

namespace vidyeet::client
{

    namespace
    {

        struct CommandName
        {
            std::string_view name;
            Command command;
            std::size_t positional;
        };

        constexpr CommandName kCommands[] = {
            {"login", Command::Login, 0},
            {"logout", Command::Logout, 0},
            {"status", Command::Status, 0},
            {"list", Command::List, 0},
            {"show", Command::Show, 1},
            {"delete", Command::Delete, 1},
            {"upload", Command::Upload, 1},
            {"help", Command::Help, 0},
            {"version", Command::Version, 0},
        };

        [[noreturn]] void usage_error(const std::string &message)
        {
            throw Error(ErrorCode::InvalidConfiguration, message + " (run 'vidyeet help' for usage)");
        }

        template <typename T>
        T parse_number(const std::string &flag, const std::string &text)
        {
            T value{};
            const auto *end = text.data() + text.size();
            const auto [ptr, ec] = std::from_chars(text.data(), end, value);
            if (ec != std::errc() || ptr != end)
            {
                usage_error(flag + " expects a non-negative integer, got '" + text + "'");
            }
            return value;
        }

        std::string take_value(int &index, int argc, char *argv[], const std::string &flag)
        {
            if (index >= argc)
            {
                usage_error(flag + " requires a value");
            }
            return argv[index++];
        }

        bool accepts(Command command, const std::string &flag)
        {
            switch (command)
            {
            case Command::Login:
                return flag == "--stdin";
            case Command::Delete:
                return flag == "--force";
            case Command::Upload:
                return flag == "--progress" || flag == "--chunk-size" || flag == "--title" || flag == "--timeout" ||
                       flag == "--no-reclaim" || flag == "--progress-interval";
            default:
                return false;
            }
        }

    } // namespace

    bool wants_machine_output(int argc, char *argv[])
    {
        for (int i = 1; i < argc; ++i)
        {
            if (std::string_view(argv[i]) == "--machine")
            {
                return true;
            }
        }
        return false;
    }

    ClientConfig parse_arguments(int argc, char *argv[])
    {
        ClientConfig config;
        std::optional<std::size_t> expected_positional;
        bool command_seen = false;

        int index = 1;
        while (index < argc)
        {
            const std::string arg = argv[index++];
            if (arg == "--machine")
            {
                config.machine_output = true;
            }
            else if (arg == "--verbose" || arg == "-v")
            {
                config.verbose = true;
            }
            else if (arg == "--log")
            {
                config.log_path = std::filesystem::path(take_value(index, argc, argv, arg));
            }
            else if (arg == "--help" || arg == "-h")
            {
                config.command = Command::Help;
                command_seen = true;
                expected_positional = 0;
            }
            else if (arg == "--version")
            {
                config.command = Command::Version;
                command_seen = true;
                expected_positional = 0;
            }
            else if (arg.rfind("--", 0) == 0)
            {
                if (!command_seen || !accepts(config.command, arg))
                {
                    usage_error("unknown option " + arg);
                }
                if (arg == "--stdin")
                {
                    config.credentials_from_stdin = true;
                }
                else if (arg == "--force")
                {
                    config.force = true;
                }
                else if (arg == "--progress")
                {
                    config.show_progress = true;
                }
                else if (arg == "--no-reclaim")
                {
                    config.no_reclaim = true;
                }
                else if (arg == "--chunk-size")
                {
                    config.chunk_size_mib = parse_number<std::uint64_t>(arg, take_value(index, argc, argv, arg));
                }
                else if (arg == "--title")
                {
                    config.title = take_value(index, argc, argv, arg);
                }
                else if (arg == "--timeout")
                {
                    config.timeout_seconds = parse_number<std::uint32_t>(arg, take_value(index, argc, argv, arg));
                }
                else if (arg == "--progress-interval")
                {
                    config.progress_interval_seconds =
                        parse_number<std::uint32_t>(arg, take_value(index, argc, argv, arg));
                }
            }
            else if (!command_seen)
            {
                bool known = false;
                for (const auto &entry : kCommands)
                {
                    if (entry.name == arg)
                    {
                        config.command = entry.command;
                        expected_positional = entry.positional;
                        known = true;
                        break;
                    }
                }
                if (!known)
                {
                    usage_error("unknown command '" + arg + "'");
                }
                command_seen = true;
            }
            else
            {
                config.positional.push_back(arg);
            }
        }

        if (expected_positional && config.positional.size() != *expected_positional)
        {
            if (config.positional.size() < *expected_positional)
            {
                usage_error("missing argument for this command");
            }
            usage_error("unexpected argument '" + config.positional[*expected_positional] + "'");
        }
        return config;
    }

    void apply_upload_overrides(const ClientConfig &config, const std::optional<std::string> &default_title,
                                UploadSettings &settings)
    {
        if (config.chunk_size_mib)
        {
            settings.chunk_size = *config.chunk_size_mib * kMiB;
        }
        if (config.timeout_seconds)
        {
            settings.upload_timeout_seconds = *config.timeout_seconds;
        }
        if (config.title)
        {
            settings.title = config.title;
        }
        else if (default_title && !default_title->empty())
        {
            settings.title = default_title;
        }
        if (config.no_reclaim)
        {
            settings.reclaim_on_quota = false;
        }
        if (config.progress_interval_seconds)
        {
            settings.progress_interval = std::chrono::seconds(*config.progress_interval_seconds);
        }
    }

} // namespace vidyeet::client
