#include "vidyeet/client/commands.hpp"

#include <algorithm>
#include <cctype>
#include <iostream>
#include <string>
#include <thread>

#include <spdlog/spdlog.h>

#include "vidyeet/api_client.hpp"
#include "vidyeet/cancellation.hpp"
#include "vidyeet/crypto.hpp"
#include "vidyeet/error_codes.hpp"
#include "vidyeet/upload/orchestrator.hpp"

namespace vidyeet::client
{

    namespace
    {

        std::string trim(const std::string &input)
        {
            const auto begin = input.find_first_not_of(" \t\r\n");
            if (begin == std::string::npos)
            {
                return "";
            }
            const auto end = input.find_last_not_of(" \t\r\n");
            return input.substr(begin, end - begin + 1);
        }

        std::string to_upper(std::string value)
        {
            std::transform(value.begin(), value.end(), value.begin(), [](unsigned char ch)
                           { return static_cast<char>(std::toupper(ch)); });
            return value;
        }

        std::string read_line(CommandContext &context, const std::string &label)
        {
            if (context.interactive)
            {
                std::cerr << label << ": " << std::flush;
            }
            std::string line;
            if (!std::getline(context.input, line))
            {
                throw Error(ErrorCode::InvalidConfiguration, "input ended before the " + label + " was provided");
            }
            return trim(line);
        }

        bool ask_yes_no(CommandContext &context, const std::string &question)
        {
            while (true)
            {
                std::cerr << question << " (y/n): " << std::flush;
                std::string answer;
                if (!std::getline(context.input, answer))
                {
                    return false;
                }
                answer = to_upper(trim(answer));
                if (answer == "Y" || answer == "YES")
                {
                    return true;
                }
                if (answer == "N" || answer == "NO")
                {
                    return false;
                }
                std::cerr << "Please answer y or n." << std::endl;
            }
        }

        Credentials require_credentials(const CommandContext &context)
        {
            auto credentials = context.store.lookup();
            if (!credentials)
            {
                throw Error(ErrorCode::CredentialsMissing, "not logged in");
            }
            return std::move(*credentials);
        }

        // Keeps the progress consumer alive for exactly as long as the upload runs.
        class ProgressConsumer
        {
        public:
            ProgressConsumer(upload::ProgressChannel &channel, Output &output, bool render)
                : channel_(channel),
                  thread_([this, &output, render]()
                          {
                              while (auto event = channel_.pop())
                              {
                                  if (render)
                                  {
                                      output.progress(*event);
                                  }
                              } }) {}

            ~ProgressConsumer()
            {
                channel_.close();
                if (thread_.joinable())
                {
                    thread_.join();
                }
            }

            ProgressConsumer(const ProgressConsumer &) = delete;
            ProgressConsumer &operator=(const ProgressConsumer &) = delete;

        private:
            upload::ProgressChannel &channel_;
            std::thread thread_;
        };

    } // namespace

    void run_login(CommandContext &context)
    {
        auto config = context.store.load();
        const bool was_logged_in = config.credentials().has_value();

        if (context.interactive && !context.config.credentials_from_stdin)
        {
            std::cerr << "Enter the access token created in the Mux dashboard." << std::endl;
        }
        Credentials credentials{
            .token_id = read_line(context, "Token ID"),
            .token_secret = read_line(context, "Token Secret"),
        };
        if (credentials.token_id.empty() || credentials.token_secret.empty())
        {
            throw Error(ErrorCode::InvalidConfiguration, "Token ID and Token Secret must not be empty", "login");
        }

        {
            ApiClient api(context.transport, context.settings.api.endpoint, credentials, &context.cancel);
            api.verify_credentials();
        }

        config.token_id = credentials.token_id;
        config.token_secret = credentials.token_secret;
        crypto::secure_wipe(credentials.token_secret);
        context.store.save(config);
        crypto::secure_wipe(*config.token_secret);
        spdlog::info("Stored credentials in {}", context.store.path().string());
        context.output.login(was_logged_in);
    }

    void run_logout(CommandContext &context)
    {
        context.output.logout(context.store.clear_credentials());
    }

    void run_status(CommandContext &context)
    {
        const auto credentials = context.store.lookup();
        if (!credentials)
        {
            context.output.status(false, std::nullopt);
            return;
        }
        const auto masked = credentials->masked_token_id();
        ApiClient api(context.transport, context.settings.api.endpoint, *credentials, &context.cancel);
        try
        {
            api.verify_credentials();
        }
        catch (const Error &ex)
        {
            if (ex.code() != ErrorCode::AuthenticationFailed)
            {
                throw;
            }
            spdlog::warn("Stored token {} was rejected: {}", masked, ex.detail());
            context.output.status(false, masked);
            return;
        }
        context.output.status(true, masked);
    }

    void run_list(CommandContext &context)
    {
        ApiClient api(context.transport, context.settings.api.endpoint, require_credentials(context), &context.cancel);
        context.output.asset_list(api.list_assets(), context.settings.streaming);
    }

    void run_show(CommandContext &context)
    {
        const auto &asset_id = context.config.positional.front();
        ApiClient api(context.transport, context.settings.api.endpoint, require_credentials(context), &context.cancel);
        context.output.asset_detail(api.get_asset(asset_id), context.settings.streaming);
    }

    void run_delete(CommandContext &context)
    {
        const auto &asset_id = context.config.positional.front();
        ApiClient api(context.transport, context.settings.api.endpoint, require_credentials(context), &context.cancel);
        if (!context.config.force)
        {
            if (context.output.machine() || !context.interactive)
            {
                throw Error(ErrorCode::InvalidConfiguration, "refusing to delete " + asset_id +
                                                                 " without confirmation; pass --force");
            }
            if (!ask_yes_no(context, "Delete asset " + asset_id + "? This cannot be undone."))
            {
                context.output.delete_declined(asset_id);
                return;
            }
        }
        api.delete_asset(asset_id);
        context.output.deleted(asset_id);
    }

    void run_upload(CommandContext &context)
    {
        const auto user_config = context.store.load();
        apply_upload_overrides(context.config, user_config.default_title, context.settings.upload);

        upload::ProgressChannel channel(context.settings.upload.progress_capacity);
        upload::UploadOrchestrator orchestrator(
            context.transport, context.settings, [&context]()
            { return context.store.lookup(); },
            &channel, context.cancel);

        upload::UploadResult result;
        try
        {
            ProgressConsumer consumer(channel, context.output, context.config.show_progress);
            result = orchestrator.run(context.config.positional.front());
        }
        catch (const Error &)
        {
            spdlog::info("Upload stopped with {} bytes acknowledged after {} chunk requests",
                         orchestrator.transfer_state().bytes_acknowledged, orchestrator.chunk_requests());
            throw;
        }
        spdlog::info("Upload took {} chunk requests and {} asset polls", orchestrator.chunk_requests(),
                     orchestrator.poll_attempts());
        if (channel.dropped() > 0)
        {
            spdlog::debug("{} progress events were dropped by a slow consumer", channel.dropped());
        }
        context.output.upload(result);
    }

    void run_command(CommandContext &context)
    {
        switch (context.config.command)
        {
        case Command::Login:
            run_login(context);
            break;
        case Command::Logout:
            run_logout(context);
            break;
        case Command::Status:
            run_status(context);
            break;
        case Command::List:
            run_list(context);
            break;
        case Command::Show:
            run_show(context);
            break;
        case Command::Delete:
            run_delete(context);
            break;
        case Command::Upload:
            run_upload(context);
            break;
        case Command::Help:
            context.output.help();
            break;
        case Command::Version:
            context.output.version();
            break;
        }
    }

} // namespace vidyeet::client
