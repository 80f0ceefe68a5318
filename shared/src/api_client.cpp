#include "vidyeet/api_client.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdint>

#include <spdlog/spdlog.h>

#include "vidyeet/cancellation.hpp"
#include "vidyeet/crypto.hpp"
#include "vidyeet/encoding/base64.hpp"
#include "vidyeet/error_codes.hpp"

namespace vidyeet
{

    namespace
    {

        constexpr std::size_t kMaxErrorBodyLength = 512;

        std::string to_lower(std::string value)
        {
            std::transform(value.begin(), value.end(), value.begin(), [](unsigned char ch)
                           { return static_cast<char>(std::tolower(ch)); });
            return value;
        }

        // Pulls the human-readable part out of {"error": {"type": ..., "messages": [...]}}.
        std::string describe_error_body(const std::string &body)
        {
            const auto json = nlohmann::json::parse(body, nullptr, false);
            if (!json.is_discarded() && json.is_object())
            {
                if (auto it = json.find("error"); it != json.end() && it->is_object())
                {
                    std::string text = it->value("type", std::string{});
                    if (auto messages = it->find("messages"); messages != it->end() && messages->is_array())
                    {
                        for (const auto &message : *messages)
                        {
                            if (message.is_string())
                            {
                                text += (text.empty() ? "" : ": ") + message.get<std::string>();
                            }
                        }
                    }
                    if (!text.empty())
                    {
                        return text;
                    }
                }
            }
            if (body.size() > kMaxErrorBodyLength)
            {
                return body.substr(0, kMaxErrorBodyLength) + "...";
            }
            return body;
        }

        bool is_quota_rejection(const http::Response &response)
        {
            if (response.status_code < 400 || response.status_code >= 500 || response.status_code == 429 ||
                response.status_code == 401)
            {
                return false;
            }
            const auto body = to_lower(response.body);
            return body.find("limit") != std::string::npos || body.find("quota") != std::string::npos;
        }

        std::uint64_t created_at_key(const std::string &created_at)
        {
            std::uint64_t value = 0;
            const auto *begin = created_at.data();
            const auto *end = created_at.data() + created_at.size();
            const auto [ptr, ec] = std::from_chars(begin, end, value);
            if (ec != std::errc() || ptr != end)
            {
                return UINT64_MAX;
            }
            return value;
        }

    } // namespace

    std::string Credentials::authorization_header() const
    {
        return "Basic " + encoding::encode_base64(token_id + ":" + token_secret);
    }

    std::string Credentials::masked_token_id() const
    {
        if (token_id.size() <= 8)
        {
            return std::string(token_id.size(), '*');
        }
        return token_id.substr(0, 4) + "***" + token_id.substr(token_id.size() - 4);
    }

    ApiClient::ApiClient(http::Transport &transport, std::string base_url, Credentials credentials,
                         const CancellationToken *cancel)
        : transport_(transport),
          base_url_(std::move(base_url)),
          credentials_(std::move(credentials)),
          cancel_(cancel)
    {
        while (!base_url_.empty() && base_url_.back() == '/')
        {
            base_url_.pop_back();
        }
    }

    ApiClient::~ApiClient()
    {
        crypto::secure_wipe(credentials_.token_secret);
    }

    http::Response ApiClient::send(http::Method method, const std::string &endpoint, const std::string &body)
    {
        if (cancel_)
        {
            cancel_->throw_if_cancelled(std::string(http::to_string(method)) + " " + endpoint);
        }

        http::Request request;
        request.method = method;
        request.url = base_url_ + endpoint;
        request.headers["Authorization"] = credentials_.authorization_header();
        request.headers["Accept"] = "application/json";
        if (method == http::Method::Post)
        {
            request.headers["Content-Type"] = "application/json";
            request.body = body;
        }

        auto response = transport_.perform(request, cancel_);
        const auto label = std::string(http::to_string(method)) + " " + endpoint;
        switch (response.error)
        {
        case http::TransportError::None:
            break;
        case http::TransportError::Aborted:
            throw Error(ErrorCode::Cancelled, label + " aborted");
        case http::TransportError::Timeout:
            throw Error(ErrorCode::RequestTimeout, label + " timed out: " + response.error_message);
        case http::TransportError::Connection:
        case http::TransportError::Other:
            throw Error(ErrorCode::NetworkFailure, label + " failed: " + response.error_message);
        }
        spdlog::debug("{} returned {}", label, response.status_code);
        return response;
    }

    http::Response ApiClient::check(http::Response response, http::Method method, const std::string &endpoint) const
    {
        if (response.success())
        {
            return response;
        }
        const auto code = classify_http_status(response.status_code);
        throw Error(code, std::string(http::to_string(method)) + " " + endpoint + " returned " +
                              std::to_string(response.status_code) + ": " + describe_error_body(response.body));
    }

    nlohmann::json ApiClient::parse_data(const http::Response &response, const std::string &endpoint) const
    {
        const auto json = nlohmann::json::parse(response.body, nullptr, false);
        if (json.is_discarded() || !json.is_object() || !json.contains("data"))
        {
            throw Error(ErrorCode::InvalidResponse, "unexpected response body from " + endpoint);
        }
        return json.at("data");
    }

    protocol::DirectUpload ApiClient::create_direct_upload(const protocol::DirectUploadRequest &request)
    {
        const std::string endpoint = "/video/v1/uploads";
        auto response = send(http::Method::Post, endpoint, nlohmann::json(request).dump());
        if (!response.success() && is_quota_rejection(response))
        {
            throw Error(ErrorCode::QuotaExceeded,
                        "POST " + endpoint + " rejected by plan limits: " + describe_error_body(response.body));
        }
        response = check(std::move(response), http::Method::Post, endpoint);
        try
        {
            auto upload = parse_data(response, endpoint).get<protocol::DirectUpload>();
            if (!upload.is_valid())
            {
                throw Error(ErrorCode::InvalidResponse, "direct upload response carries no upload URL");
            }
            return upload;
        }
        catch (const nlohmann::json::exception &ex)
        {
            throw Error(ErrorCode::InvalidResponse, std::string("malformed direct upload: ") + ex.what());
        }
    }

    protocol::DirectUpload ApiClient::get_direct_upload(const std::string &upload_id)
    {
        const std::string endpoint = "/video/v1/uploads/" + upload_id;
        const auto response = check(send(http::Method::Get, endpoint), http::Method::Get, endpoint);
        try
        {
            return parse_data(response, endpoint).get<protocol::DirectUpload>();
        }
        catch (const nlohmann::json::exception &ex)
        {
            throw Error(ErrorCode::InvalidResponse, std::string("malformed upload status: ") + ex.what());
        }
    }

    protocol::Asset ApiClient::get_asset(const std::string &asset_id)
    {
        const std::string endpoint = "/video/v1/assets/" + asset_id;
        const auto response = check(send(http::Method::Get, endpoint), http::Method::Get, endpoint);
        try
        {
            return parse_data(response, endpoint).get<protocol::Asset>();
        }
        catch (const nlohmann::json::exception &ex)
        {
            throw Error(ErrorCode::InvalidResponse, std::string("malformed asset: ") + ex.what());
        }
    }

    protocol::AssetList ApiClient::list_assets(unsigned limit)
    {
        const std::string endpoint = "/video/v1/assets?limit=" + std::to_string(limit);
        const auto response = check(send(http::Method::Get, endpoint), http::Method::Get, endpoint);
        const auto json = nlohmann::json::parse(response.body, nullptr, false);
        if (json.is_discarded() || !json.is_object())
        {
            throw Error(ErrorCode::InvalidResponse, "unexpected response body from " + endpoint);
        }
        try
        {
            return json.get<protocol::AssetList>();
        }
        catch (const nlohmann::json::exception &ex)
        {
            throw Error(ErrorCode::InvalidResponse, std::string("malformed asset list: ") + ex.what());
        }
    }

    void ApiClient::delete_asset(const std::string &asset_id)
    {
        const std::string endpoint = "/video/v1/assets/" + asset_id;
        check(send(http::Method::Delete, endpoint), http::Method::Delete, endpoint);
        spdlog::info("Deleted asset {}", asset_id);
    }

    std::optional<std::string> ApiClient::delete_oldest_asset()
    {
        const auto assets = list_assets();
        if (assets.data.empty())
        {
            return std::nullopt;
        }
        const auto oldest = std::min_element(assets.data.begin(), assets.data.end(),
                                             [](const protocol::Asset &lhs, const protocol::Asset &rhs)
                                             {
                                                 return created_at_key(lhs.created_at) < created_at_key(rhs.created_at);
                                             });
        delete_asset(oldest->id);
        return oldest->id;
    }

    void ApiClient::verify_credentials()
    {
        list_assets(1);
        spdlog::info("Credentials for token {} accepted", credentials_.masked_token_id());
    }

} // namespace vidyeet
