#pragma once

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <functional>
#include <string>
#include <string_view>
#include <vector>

#include <unistd.h>

#include <nlohmann/json.hpp>

#include "vidyeet/http.hpp"
#include "vidyeet/settings.hpp"

namespace vidyeet::testing
{

    inline http::Response json_response(int status, const nlohmann::json &body)
    {
        http::Response response;
        response.status_code = status;
        response.body = body.dump();
        return response;
    }

    inline http::Response status_response(int status)
    {
        http::Response response;
        response.status_code = status;
        return response;
    }

    // 308 from the storage endpoint, reporting bytes [0, last_byte] as persisted.
    inline http::Response resume_incomplete(std::uint64_t last_byte)
    {
        http::Response response;
        response.status_code = 308;
        response.headers["range"] = "bytes=0-" + std::to_string(last_byte);
        return response;
    }

    inline http::Response transport_failure(http::TransportError error)
    {
        http::Response response;
        response.error = error;
        response.error_message = "simulated transport failure";
        return response;
    }

    // Records every request and answers through a replaceable handler.
    class FakeTransport : public http::Transport
    {
    public:
        using Handler = std::function<http::Response(const http::Request &)>;

        explicit FakeTransport(Handler handler = {}) : handler_(std::move(handler)) {}

        void set_handler(Handler handler) { handler_ = std::move(handler); }

        http::Response perform(const http::Request &request, const CancellationToken *) override
        {
            requests.push_back(request);
            return handler_ ? handler_(request) : status_response(500);
        }

        std::size_t count(http::Method method, std::string_view url_fragment = {}) const
        {
            std::size_t total = 0;
            for (const auto &request : requests)
            {
                if (request.method == method && request.url.find(url_fragment) != std::string::npos)
                {
                    ++total;
                }
            }
            return total;
        }

        std::vector<std::string> content_ranges() const
        {
            std::vector<std::string> ranges;
            for (const auto &request : requests)
            {
                if (request.method == http::Method::Put)
                {
                    ranges.push_back(request.headers.at("Content-Range"));
                }
            }
            return ranges;
        }

        std::vector<http::Request> requests;

    private:
        Handler handler_;
    };

    // Minimal stand-in for the video API plus the signed storage URL.
    struct FakeVideoService
    {
        std::string upload_url{"https://storage.test/upload/up-1?signature=secret"};
        std::uint32_t quota_failures{0};
        std::uint32_t polls_before_asset{0};
        std::string asset_status{"ready"};
        bool mp4_ready{false};
        std::vector<nlohmann::json> existing_assets;
        std::vector<std::string> deleted_assets;
        std::function<http::Response(const http::Request &, std::uint32_t)> put_handler;

        std::uint32_t posts{0};
        std::uint32_t puts{0};
        std::uint32_t upload_polls{0};

        http::Response operator()(const http::Request &request)
        {
            const auto &url = request.url;
            if (request.method == http::Method::Put)
            {
                ++puts;
                return put_handler ? put_handler(request, puts) : status_response(200);
            }
            if (request.method == http::Method::Post && url.ends_with("/video/v1/uploads"))
            {
                ++posts;
                if (quota_failures > 0)
                {
                    --quota_failures;
                    return json_response(400, {{"error",
                                                {{"type", "invalid_parameters"},
                                                 {"messages", {"Free plan is limited to 10 assets"}}}}});
                }
                return json_response(201, {{"data",
                                            {{"id", "up-1"},
                                             {"url", upload_url},
                                             {"timeout", 3600},
                                             {"status", "waiting"},
                                             {"cors_origin", "*"}}}});
            }
            if (request.method == http::Method::Get && url.ends_with("/video/v1/uploads/up-1"))
            {
                ++upload_polls;
                nlohmann::json data = {{"id", "up-1"}, {"timeout", 3600}, {"status", "waiting"}};
                if (upload_polls > polls_before_asset)
                {
                    data["status"] = "asset_created";
                    data["asset_id"] = "asset-1";
                }
                return json_response(200, {{"data", data}});
            }
            if (request.method == http::Method::Get && url.ends_with("/video/v1/assets/asset-1"))
            {
                nlohmann::json data = {
                    {"id", "asset-1"},
                    {"status", asset_status},
                    {"created_at", "1700000000"},
                    {"playback_ids", {{{"id", "pb-1"}, {"policy", "public"}}}},
                };
                if (mp4_ready)
                {
                    data["static_renditions"] = {
                        {"files", {{{"name", "highest.mp4"}, {"ext", "mp4"}, {"status", "ready"}}}}};
                }
                if (asset_status == "errored")
                {
                    data["errors"] = {{"type", "invalid_input"}, {"messages", {"File is not a valid video"}}};
                }
                return json_response(200, {{"data", data}});
            }
            if (request.method == http::Method::Get && url.find("/video/v1/assets?limit=") != std::string::npos)
            {
                return json_response(200, {{"data", existing_assets}});
            }
            if (request.method == http::Method::Delete && url.find("/video/v1/assets/") != std::string::npos)
            {
                deleted_assets.push_back(url.substr(url.rfind('/') + 1));
                return status_response(204);
            }
            return status_response(404);
        }
    };

    inline AppSettings fast_settings()
    {
        AppSettings settings;
        settings.api.endpoint = "https://api.test";
        settings.upload.chunk_size = kChunkGranularity;
        settings.upload.retry.base_delay = std::chrono::milliseconds(0);
        settings.upload.retry.max_delay = std::chrono::milliseconds(0);
        settings.upload.poll.interval = std::chrono::milliseconds(0);
        settings.upload.progress_interval = std::chrono::milliseconds(0);
        return settings;
    }

    // Scratch directory removed when the object goes out of scope.
    class TempDir
    {
    public:
        TempDir()
        {
            static int counter = 0;
            path_ = std::filesystem::temp_directory_path() /
                    ("vidyeet_tests_" + std::to_string(::getpid()) + "_" + std::to_string(counter++));
            std::filesystem::create_directories(path_);
        }

        ~TempDir()
        {
            std::error_code ec;
            std::filesystem::remove_all(path_, ec);
        }

        TempDir(const TempDir &) = delete;
        TempDir &operator=(const TempDir &) = delete;

        const std::filesystem::path &path() const noexcept { return path_; }

        std::filesystem::path write_file(const std::string &name, std::uint64_t size) const
        {
            const auto file = path_ / name;
            std::ofstream out(file, std::ios::binary | std::ios::trunc);
            for (std::uint64_t i = 0; i < size; ++i)
            {
                out.put(static_cast<char>('a' + i % 26));
            }
            return file;
        }

    private:
        std::filesystem::path path_;
    };

} // namespace vidyeet::testing
