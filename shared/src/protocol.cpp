#include "vidyeet/protocol.hpp"

#include <array>

namespace vidyeet::protocol
{

    namespace
    {

        struct AssetStatusMapping
        {
            AssetStatus status;
            std::string_view label;
        };

        constexpr std::array<AssetStatusMapping, 3> kAssetStatusMappings{{
            {AssetStatus::Preparing, "preparing"},
            {AssetStatus::Ready, "ready"},
            {AssetStatus::Errored, "errored"},
        }};

        template <typename T>
        void read_optional(const nlohmann::json &json, const char *key, std::optional<T> &target)
        {
            if (auto it = json.find(key); it != json.end() && !it->is_null())
            {
                target = it->get<T>();
            }
        }

        template <typename T>
        void read_list(const nlohmann::json &json, const char *key, std::vector<T> &target)
        {
            if (auto it = json.find(key); it != json.end() && it->is_array())
            {
                target = it->get<std::vector<T>>();
            }
        }

        // created_at arrives as a string of epoch seconds, older payloads send a number.
        std::string read_timestamp(const nlohmann::json &json, const char *key)
        {
            auto it = json.find(key);
            if (it == json.end() || it->is_null())
            {
                return {};
            }
            if (it->is_string())
            {
                return it->get<std::string>();
            }
            return it->dump();
        }

    } // namespace

    std::string_view to_string(AssetStatus status) noexcept
    {
        for (const auto &mapping : kAssetStatusMappings)
        {
            if (mapping.status == status)
            {
                return mapping.label;
            }
        }
        return "preparing";
    }

    AssetStatus asset_status_from_string(std::string_view value) noexcept
    {
        for (const auto &mapping : kAssetStatusMappings)
        {
            if (mapping.label == value)
            {
                return mapping.status;
            }
        }
        return AssetStatus::Preparing;
    }

    void to_json(nlohmann::json &json, const AssetMeta &meta)
    {
        json = nlohmann::json::object();
        if (meta.title)
        {
            json["title"] = *meta.title;
        }
        if (meta.creator_id)
        {
            json["creator_id"] = *meta.creator_id;
        }
        if (meta.external_id)
        {
            json["external_id"] = *meta.external_id;
        }
    }

    void from_json(const nlohmann::json &json, AssetMeta &meta)
    {
        read_optional(json, "title", meta.title);
        read_optional(json, "creator_id", meta.creator_id);
        read_optional(json, "external_id", meta.external_id);
    }

    void to_json(nlohmann::json &json, const NewAssetSettings &settings)
    {
        json = {
            {"playback_policies", settings.playback_policies},
        };
        if (settings.video_quality)
        {
            json["video_quality"] = *settings.video_quality;
        }
        if (settings.meta)
        {
            json["meta"] = *settings.meta;
        }
        if (!settings.static_rendition_resolutions.empty())
        {
            auto renditions = nlohmann::json::array();
            for (const auto &resolution : settings.static_rendition_resolutions)
            {
                renditions.push_back({{"resolution", resolution}});
            }
            json["static_renditions"] = std::move(renditions);
        }
    }

    void from_json(const nlohmann::json &json, NewAssetSettings &settings)
    {
        read_list(json, "playback_policies", settings.playback_policies);
        read_optional(json, "video_quality", settings.video_quality);
        read_optional(json, "meta", settings.meta);
        if (auto it = json.find("static_renditions"); it != json.end() && it->is_array())
        {
            for (const auto &item : *it)
            {
                settings.static_rendition_resolutions.push_back(item.value("resolution", std::string{}));
            }
        }
    }

    void to_json(nlohmann::json &json, const DirectUploadRequest &request)
    {
        json = {
            {"cors_origin", request.cors_origin},
            {"new_asset_settings", request.new_asset_settings},
            {"timeout", request.timeout},
        };
    }

    void from_json(const nlohmann::json &json, RemoteError &error)
    {
        error.type = json.value("type", std::string{});
        error.message = json.value("message", std::string{});
    }

    void from_json(const nlohmann::json &json, DirectUpload &upload)
    {
        upload.id = json.at("id").get<std::string>();
        upload.timeout = json.value("timeout", 0U);
        upload.status = json.value("status", std::string{});
        read_optional(json, "url", upload.url);
        read_optional(json, "asset_id", upload.asset_id);
        read_optional(json, "error", upload.error);
        read_optional(json, "cors_origin", upload.cors_origin);
    }

    void to_json(nlohmann::json &json, const PlaybackId &playback)
    {
        json = {
            {"id", playback.id},
            {"policy", playback.policy},
        };
    }

    void from_json(const nlohmann::json &json, PlaybackId &playback)
    {
        playback.id = json.at("id").get<std::string>();
        playback.policy = json.value("policy", std::string{});
    }

    void to_json(nlohmann::json &json, const StaticRendition &rendition)
    {
        json = {
            {"id", rendition.id},
            {"type", rendition.type},
            {"status", rendition.status},
            {"resolution", rendition.resolution},
            {"name", rendition.name},
            {"ext", rendition.ext},
        };
    }

    void from_json(const nlohmann::json &json, StaticRendition &rendition)
    {
        rendition.id = json.value("id", std::string{});
        rendition.type = json.value("type", std::string{});
        rendition.status = json.value("status", std::string{});
        rendition.resolution = json.value("resolution", std::string{});
        rendition.name = json.value("name", std::string{});
        rendition.ext = json.value("ext", std::string{});
    }

    void from_json(const nlohmann::json &json, Track &track)
    {
        track.type = json.value("type", std::string{});
        read_optional(json, "duration", track.duration);
    }

    void from_json(const nlohmann::json &json, Asset &asset)
    {
        asset.id = json.at("id").get<std::string>();
        asset.status = json.value("status", std::string{});
        read_list(json, "playback_ids", asset.playback_ids);
        read_list(json, "tracks", asset.tracks);
        read_optional(json, "duration", asset.duration);
        asset.created_at = read_timestamp(json, "created_at");
        read_optional(json, "aspect_ratio", asset.aspect_ratio);
        read_optional(json, "video_quality", asset.video_quality);
        if (auto it = json.find("static_renditions"); it != json.end() && !it->is_null())
        {
            // Newer payloads wrap the list as {"files": [...]}.
            if (it->is_array())
            {
                asset.static_renditions = it->get<std::vector<StaticRendition>>();
            }
            else if (it->is_object())
            {
                read_list(*it, "files", asset.static_renditions);
            }
        }
        if (auto it = json.find("errors"); it != json.end() && it->is_object())
        {
            read_list(*it, "messages", asset.error_messages);
        }
    }

    void from_json(const nlohmann::json &json, AssetList &list)
    {
        read_list(json, "data", list.data);
        read_optional(json, "next_cursor", list.next_cursor);
    }

    std::optional<std::string> Asset::first_playback_id() const
    {
        if (playback_ids.empty())
        {
            return std::nullopt;
        }
        return playback_ids.front().id;
    }

    const StaticRendition *Asset::ready_mp4_rendition() const noexcept
    {
        for (const auto &rendition : static_renditions)
        {
            if (rendition.status == "ready" && rendition.ext == "mp4")
            {
                return &rendition;
            }
        }
        return nullptr;
    }

    std::string hls_url(std::string_view streaming_host, std::string_view playback_id)
    {
        std::string url("https://");
        url.append(streaming_host).append("/").append(playback_id).append(".m3u8");
        return url;
    }

    std::string mp4_url(std::string_view streaming_host, std::string_view playback_id, std::string_view rendition_name)
    {
        std::string url("https://");
        url.append(streaming_host).append("/").append(playback_id).append("/").append(rendition_name);
        return url;
    }

} // namespace vidyeet::protocol
