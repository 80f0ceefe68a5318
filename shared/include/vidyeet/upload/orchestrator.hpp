/**
 * vidyeet - Drives one upload from local validation to a playable asset.
 *
 * Steps run in a fixed order: validate, credentials, create_target, plan, transfer, await_asset.
 * Any failure is rethrown as an Error tagged with the step that produced it, after a Failed
 * event has been pushed. The progress channel is closed whichever way run() exits.
 */
#pragma once

#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "vidyeet/api_client.hpp"
#include "vidyeet/http.hpp"
#include "vidyeet/settings.hpp"
#include "vidyeet/upload/asset_awaiter.hpp"
#include "vidyeet/upload/file_validator.hpp"
#include "vidyeet/upload/progress.hpp"
#include "vidyeet/upload/transfer_executor.hpp"

namespace vidyeet
{
    class CancellationToken;
}

namespace vidyeet::upload
{

    struct UploadResult
    {
        std::string asset_id;
        std::optional<std::string> playback_id;
        std::optional<std::string> hls_url;
        std::optional<std::string> mp4_url;
        Mp4Status mp4_status{Mp4Status::Generating};
        std::string file_path;
        std::uint64_t file_size{};
        std::string file_format;
        std::uint64_t bytes_sent{};
        std::uint32_t total_chunks{};
        std::uint32_t deleted_old_assets{};
    };

    void to_json(nlohmann::json &json, const UploadResult &result);

    // Returns nullopt when no credentials have been configured.
    using CredentialLookup = std::function<std::optional<Credentials>()>;

    class UploadOrchestrator
    {
    public:
        UploadOrchestrator(http::Transport &transport, AppSettings settings, CredentialLookup credentials,
                           ProgressChannel *channel, const CancellationToken &cancel, SteadyClock clock = {});

        UploadResult run(const std::filesystem::path &path);

        const TransferState &transfer_state() const noexcept { return transfer_state_; }
        std::uint64_t chunk_requests() const noexcept { return chunk_requests_; }
        std::uint32_t poll_attempts() const noexcept { return poll_attempts_; }

    private:
        protocol::DirectUploadRequest build_upload_request(const FileHandle &file) const;
        UploadSession create_target(ApiClient &api, const FileHandle &file, UploadResult &result);
        void transfer(const FileHandle &file, const ChunkPlan &plan, const UploadSession &session);

        http::Transport &transport_;
        AppSettings settings_;
        CredentialLookup credentials_;
        const CancellationToken &cancel_;
        ProgressEmitter emitter_;
        TransferState transfer_state_{};
        std::uint64_t chunk_requests_{0};
        std::uint32_t poll_attempts_{0};
    };

} // namespace vidyeet::upload
