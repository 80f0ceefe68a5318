#include "vidyeet/client/credential_store.hpp"

#include <cstdlib>
#include <fstream>
#include <system_error>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "vidyeet/error_codes.hpp"

namespace vidyeet::client
{

    namespace
    {

        std::optional<std::string> read_string(const nlohmann::json &json, const char *key)
        {
            if (auto it = json.find(key); it != json.end() && it->is_string())
            {
                return it->get<std::string>();
            }
            return std::nullopt;
        }

    } // namespace

    std::optional<Credentials> UserConfig::credentials() const
    {
        if (!token_id || !token_secret || token_id->empty() || token_secret->empty())
        {
            return std::nullopt;
        }
        return Credentials{.token_id = *token_id, .token_secret = *token_secret};
    }

    CredentialStore::CredentialStore() : config_path_(default_config_path()) {}

    CredentialStore::CredentialStore(std::filesystem::path config_path) : config_path_(std::move(config_path)) {}

    std::filesystem::path CredentialStore::default_config_path()
    {
        if (const char *dir = std::getenv("VIDYEET_CONFIG_DIR"); dir && *dir)
        {
            return std::filesystem::path(dir) / "config.json";
        }
        if (const char *xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg)
        {
            return std::filesystem::path(xdg) / "vidyeet" / "config.json";
        }
        if (const char *home = std::getenv("HOME"))
        {
            return std::filesystem::path(home) / ".config" / "vidyeet" / "config.json";
        }
        return std::filesystem::path(".vidyeet") / "config.json";
    }

    UserConfig CredentialStore::load() const
    {
        UserConfig config;
        std::error_code ec;
        if (!std::filesystem::exists(config_path_, ec))
        {
            return config;
        }
        std::ifstream in(config_path_);
        if (!in.is_open())
        {
            throw Error(ErrorCode::InvalidConfiguration, "cannot read " + config_path_.string());
        }
        const auto json = nlohmann::json::parse(in, nullptr, false);
        if (json.is_discarded() || !json.is_object())
        {
            throw Error(ErrorCode::InvalidConfiguration, config_path_.string() + " is not a JSON object");
        }
        config.token_id = read_string(json, "token_id");
        config.token_secret = read_string(json, "token_secret");
        config.default_title = read_string(json, "default_title");
        return config;
    }

    void CredentialStore::save(const UserConfig &config) const
    {
        const auto dir = config_path_.parent_path();
        std::error_code ec;
        if (!dir.empty())
        {
            std::filesystem::create_directories(dir, ec);
            if (ec)
            {
                throw Error(ErrorCode::InvalidConfiguration,
                            "cannot create " + dir.string() + ": " + ec.message());
            }
        }

        nlohmann::json json = nlohmann::json::object();
        if (config.token_id)
        {
            json["token_id"] = *config.token_id;
        }
        if (config.token_secret)
        {
            json["token_secret"] = *config.token_secret;
        }
        if (config.default_title)
        {
            json["default_title"] = *config.default_title;
        }

        // Restrict the file before the secret is written into it.
        {
            std::ofstream touch(config_path_, std::ios::app);
        }
        std::filesystem::permissions(config_path_,
                                     std::filesystem::perms::owner_read | std::filesystem::perms::owner_write,
                                     std::filesystem::perm_options::replace, ec);
        if (ec)
        {
            spdlog::warn("Could not restrict permissions of {}: {}", config_path_.string(), ec.message());
        }

        std::ofstream out(config_path_, std::ios::trunc);
        if (!out.is_open())
        {
            throw Error(ErrorCode::InvalidConfiguration, "cannot write " + config_path_.string());
        }
        out << json.dump(2);
        if (!out)
        {
            throw Error(ErrorCode::InvalidConfiguration, "failed writing " + config_path_.string());
        }
        spdlog::debug("Saved config to {}", config_path_.string());
    }

    bool CredentialStore::clear_credentials() const
    {
        auto config = load();
        const bool had_credentials = config.credentials().has_value();
        if (!config.token_id && !config.token_secret)
        {
            return had_credentials;
        }
        config.token_id.reset();
        config.token_secret.reset();
        save(config);
        return had_credentials;
    }

    std::optional<Credentials> CredentialStore::lookup() const
    {
        return load().credentials();
    }

} // namespace vidyeet::client
