#pragma once

#include <filesystem>
#include <optional>
#include <string>

#include "vidyeet/api_client.hpp"

namespace vidyeet::client
{

    struct UserConfig
    {
        std::optional<std::string> token_id;
        std::optional<std::string> token_secret;
        std::optional<std::string> default_title;

        std::optional<Credentials> credentials() const;
    };

    // Per-user JSON config holding the API token. The file is readable by its owner only.
    class CredentialStore
    {
    public:
        CredentialStore();
        explicit CredentialStore(std::filesystem::path config_path);

        // $VIDYEET_CONFIG_DIR, then $XDG_CONFIG_HOME/vidyeet, then $HOME/.config/vidyeet.
        static std::filesystem::path default_config_path();

        const std::filesystem::path &path() const noexcept { return config_path_; }

        // A missing file yields an empty config; an unreadable one throws InvalidConfiguration.
        UserConfig load() const;
        void save(const UserConfig &config) const;

        // Returns true when credentials were present.
        bool clear_credentials() const;

        std::optional<Credentials> lookup() const;

    private:
        std::filesystem::path config_path_;
    };

} // namespace vidyeet::client
