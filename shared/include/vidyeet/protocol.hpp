/**
 * vidyeet - Video API schema and serialization helpers.
 */
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

namespace vidyeet::protocol
{

    enum class AssetStatus : std::uint8_t
    {
        Preparing,
        Ready,
        Errored
    };

    std::string_view to_string(AssetStatus status) noexcept;

    // Anything the service reports besides "ready" and "errored" is still in progress.
    AssetStatus asset_status_from_string(std::string_view value) noexcept;

    struct AssetMeta
    {
        std::optional<std::string> title{};
        std::optional<std::string> creator_id{};
        std::optional<std::string> external_id{};
    };

    void to_json(nlohmann::json &json, const AssetMeta &meta);
    void from_json(const nlohmann::json &json, AssetMeta &meta);

    struct NewAssetSettings
    {
        std::vector<std::string> playback_policies{};
        std::optional<std::string> video_quality{};
        std::optional<AssetMeta> meta{};
        std::vector<std::string> static_rendition_resolutions{};
    };

    void to_json(nlohmann::json &json, const NewAssetSettings &settings);
    void from_json(const nlohmann::json &json, NewAssetSettings &settings);

    struct DirectUploadRequest
    {
        std::string cors_origin{"*"};
        NewAssetSettings new_asset_settings{};
        std::uint32_t timeout{3600};
    };

    void to_json(nlohmann::json &json, const DirectUploadRequest &request);

    struct RemoteError
    {
        std::string type;
        std::string message;
    };

    void from_json(const nlohmann::json &json, RemoteError &error);

    struct DirectUpload
    {
        std::string id;
        std::uint32_t timeout{};
        std::string status;
        std::optional<std::string> url{};
        std::optional<std::string> asset_id{};
        std::optional<RemoteError> error{};
        std::optional<std::string> cors_origin{};

        bool is_valid() const noexcept
        {
            return !id.empty() && url.has_value() && !url->empty();
        }
    };

    void from_json(const nlohmann::json &json, DirectUpload &upload);

    struct PlaybackId
    {
        std::string id;
        std::string policy;
    };

    void to_json(nlohmann::json &json, const PlaybackId &playback);
    void from_json(const nlohmann::json &json, PlaybackId &playback);

    struct StaticRendition
    {
        std::string id;
        std::string type;
        std::string status;
        std::string resolution;
        std::string name;
        std::string ext;
    };

    void to_json(nlohmann::json &json, const StaticRendition &rendition);
    void from_json(const nlohmann::json &json, StaticRendition &rendition);

    struct Track
    {
        std::string type;
        std::optional<double> duration{};
    };

    void from_json(const nlohmann::json &json, Track &track);

    struct Asset
    {
        std::string id;
        std::string status;
        std::vector<PlaybackId> playback_ids{};
        std::vector<Track> tracks{};
        std::optional<double> duration{};
        std::string created_at;
        std::optional<std::string> aspect_ratio{};
        std::optional<std::string> video_quality{};
        std::vector<StaticRendition> static_renditions{};
        std::vector<std::string> error_messages{};

        AssetStatus asset_status() const noexcept { return asset_status_from_string(status); }
        std::optional<std::string> first_playback_id() const;
        const StaticRendition *ready_mp4_rendition() const noexcept;
    };

    void from_json(const nlohmann::json &json, Asset &asset);

    struct AssetList
    {
        std::vector<Asset> data{};
        std::optional<std::string> next_cursor{};
    };

    void from_json(const nlohmann::json &json, AssetList &list);

    std::string hls_url(std::string_view streaming_host, std::string_view playback_id);

    std::string mp4_url(std::string_view streaming_host, std::string_view playback_id, std::string_view rendition_name);

} // namespace vidyeet::protocol
