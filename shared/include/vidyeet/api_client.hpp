/**
 * vidyeet - Authenticated client for the video API.
 */
#pragma once

#include <optional>
#include <string>

#include "vidyeet/http.hpp"
#include "vidyeet/protocol.hpp"

namespace vidyeet
{

    class CancellationToken;

    struct Credentials
    {
        std::string token_id;
        std::string token_secret;

        std::string authorization_header() const;
        std::string masked_token_id() const;
    };

    class ApiClient
    {
    public:
        ApiClient(http::Transport &transport, std::string base_url, Credentials credentials,
                  const CancellationToken *cancel = nullptr);
        ~ApiClient();

        ApiClient(const ApiClient &) = delete;
        ApiClient &operator=(const ApiClient &) = delete;

        protocol::DirectUpload create_direct_upload(const protocol::DirectUploadRequest &request);
        protocol::DirectUpload get_direct_upload(const std::string &upload_id);
        protocol::Asset get_asset(const std::string &asset_id);
        protocol::AssetList list_assets(unsigned limit = 100);
        void delete_asset(const std::string &asset_id);

        // Deletes the asset with the oldest created_at. Returns its id, or nullopt when none exist.
        std::optional<std::string> delete_oldest_asset();

        // Issues an authenticated listing; throws AuthenticationFailed when the token is rejected.
        void verify_credentials();

        const Credentials &credentials() const noexcept { return credentials_; }

    private:
        http::Response send(http::Method method, const std::string &endpoint, const std::string &body = {});
        http::Response check(http::Response response, http::Method method, const std::string &endpoint) const;
        nlohmann::json parse_data(const http::Response &response, const std::string &endpoint) const;

        http::Transport &transport_;
        std::string base_url_;
        Credentials credentials_;
        const CancellationToken *cancel_;
    };

} // namespace vidyeet
