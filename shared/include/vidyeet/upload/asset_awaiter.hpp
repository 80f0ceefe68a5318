/**
 * vidyeet - Polls the API after the transfer until the uploaded file becomes a playable asset.
 *
 * Polling first follows the direct upload until it names an asset, then the asset itself.
 * Each attempt waits `interval` beforehand, so the nominal elapsed time is attempt * interval.
 */
#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "vidyeet/api_client.hpp"
#include "vidyeet/protocol.hpp"
#include "vidyeet/settings.hpp"

namespace vidyeet
{
    class CancellationToken;
}

namespace vidyeet::upload
{

    class ProgressEmitter;

    enum class AwaitState : std::uint8_t
    {
        Polling,
        Ready,
        Errored,
        TimedOut,
        Cancelled
    };

    std::string_view to_string(AwaitState state) noexcept;

    enum class Mp4Status : std::uint8_t
    {
        Ready,
        Generating
    };

    std::string_view to_string(Mp4Status status) noexcept;

    struct ResolvedAsset
    {
        std::string asset_id;
        std::optional<std::string> playback_id;
        std::optional<std::string> hls_url;
        std::optional<std::string> mp4_url;
        Mp4Status mp4_status{Mp4Status::Generating};
        protocol::Asset asset;
    };

    // Playback URLs of a ready asset. The MP4 URL falls back to the predicted default rendition.
    ResolvedAsset resolve_asset(const protocol::Asset &asset, const StreamingSettings &streaming);

    class AssetAwaiter
    {
    public:
        AssetAwaiter(ApiClient &api, PollPolicy policy, StreamingSettings streaming, const CancellationToken *cancel,
                     ProgressEmitter *emitter);

        // Throws AssetErrored, AssetTimedOut or Cancelled, and propagates terminal API failures.
        ResolvedAsset wait(const std::string &upload_id);

        AwaitState state() const noexcept { return state_; }
        std::uint32_t attempts() const noexcept { return attempts_; }

    private:
        // Returns the asset once it is ready; nullopt while still processing.
        std::optional<protocol::Asset> poll_once(const std::string &upload_id);
        void pause();

        ApiClient &api_;
        PollPolicy policy_;
        StreamingSettings streaming_;
        const CancellationToken *cancel_;
        ProgressEmitter *emitter_;
        AwaitState state_{AwaitState::Polling};
        std::uint32_t attempts_{0};
        std::optional<std::string> asset_id_;
    };

} // namespace vidyeet::upload
