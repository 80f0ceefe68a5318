#include <asio.hpp>

#include <csignal>
#include <cstdlib>
#include <iostream>
#include <thread>

#include <unistd.h>

#include <spdlog/spdlog.h>

#include "vidyeet/cancellation.hpp"
#include "vidyeet/client/commands.hpp"
#include "vidyeet/client/config.hpp"
#include "vidyeet/client/credential_store.hpp"
#include "vidyeet/client/logger.hpp"
#include "vidyeet/client/output.hpp"
#include "vidyeet/error_codes.hpp"
#include "vidyeet/http.hpp"
#include "vidyeet/settings.hpp"
#include "vidyeet/version.hpp"

namespace
{

    // Turns SIGINT/SIGTERM into a cancellation request while a command runs.
    class SignalCancellation
    {
    public:
        explicit SignalCancellation(vidyeet::CancellationToken &cancel)
            : signals_(io_context_, SIGINT, SIGTERM)
        {
            signals_.async_wait([&cancel](const std::error_code &ec, int signal)
                                {
                                    if (!ec)
                                    {
                                        spdlog::warn("Signal {} received, cancelling", signal);
                                        cancel.request_cancel();
                                    } });
            worker_ = std::thread([this]()
                                  { io_context_.run(); });
        }

        ~SignalCancellation()
        {
            io_context_.stop();
            if (worker_.joinable())
            {
                worker_.join();
            }
        }

        SignalCancellation(const SignalCancellation &) = delete;
        SignalCancellation &operator=(const SignalCancellation &) = delete;

    private:
        asio::io_context io_context_;
        asio::signal_set signals_;
        std::thread worker_;
    };

} // namespace

int main(int argc, char *argv[])
{
    using vidyeet::client::Output;

    const bool machine = vidyeet::client::wants_machine_output(argc, argv) || isatty(STDOUT_FILENO) != 1;
    Output output(machine, std::cout, std::cerr);
    try
    {
        const auto config = vidyeet::client::parse_arguments(argc, argv);
        vidyeet::client::install_logger(config.log_path, config.verbose);
        spdlog::debug("vidyeet {} starting", vidyeet::version());

        const auto &settings = vidyeet::default_settings();
        vidyeet::CancellationToken cancel;
        SignalCancellation signals(cancel);
        vidyeet::http::CurlTransport transport(settings.api.request_timeout);
        vidyeet::client::CredentialStore store;

        vidyeet::client::CommandContext context{
            .config = config,
            .settings = settings,
            .store = store,
            .transport = transport,
            .output = output,
            .cancel = cancel,
            .input = std::cin,
            .interactive = isatty(STDIN_FILENO) == 1,
        };
        vidyeet::client::run_command(context);
        return EXIT_SUCCESS;
    }
    catch (const vidyeet::Error &ex)
    {
        spdlog::error("{}", ex.what());
        output.failure(ex);
        return vidyeet::exit_code(ex.category());
    }
    catch (const std::exception &ex)
    {
        const vidyeet::Error wrapped(vidyeet::ErrorCode::InternalError, ex.what());
        spdlog::error("Fatal error: {}", ex.what());
        output.failure(wrapped);
        return vidyeet::exit_code(wrapped.category());
    }
}
