#pragma once

#include <iosfwd>

#include "vidyeet/client/config.hpp"
#include "vidyeet/client/credential_store.hpp"
#include "vidyeet/client/output.hpp"
#include "vidyeet/http.hpp"
#include "vidyeet/settings.hpp"

namespace vidyeet
{
    class CancellationToken;
}

namespace vidyeet::client
{

    struct CommandContext
    {
        const ClientConfig &config;
        AppSettings settings;
        const CredentialStore &store;
        http::Transport &transport;
        Output &output;
        const CancellationToken &cancel;
        std::istream &input;
        // Prompts are only shown when input comes from a terminal.
        bool interactive{false};
    };

    // Runs the selected command and reports its result. Failures propagate as Error.
    void run_command(CommandContext &context);

    void run_login(CommandContext &context);
    void run_logout(CommandContext &context);
    void run_status(CommandContext &context);
    void run_list(CommandContext &context);
    void run_show(CommandContext &context);
    void run_delete(CommandContext &context);
    void run_upload(CommandContext &context);

} // namespace vidyeet::client
