/**
 * vidyeet - Application defaults and runtime-overridable upload settings.
 */
#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace vidyeet
{

    constexpr std::uint64_t kMiB = 1024ULL * 1024ULL;
    constexpr std::uint64_t kChunkGranularity = 256ULL * 1024ULL;
    constexpr std::uint64_t kDefaultChunkSize = 32ULL * kMiB;

    constexpr std::uint32_t kMinUploadTimeoutSeconds = 60;
    constexpr std::uint32_t kMaxUploadTimeoutSeconds = 604800;

    struct ApiSettings
    {
        std::string endpoint{"https://api.mux.com"};
        std::chrono::seconds request_timeout{300};
    };

    struct RetryPolicy
    {
        std::uint32_t max_attempts{5};
        std::chrono::milliseconds base_delay{1000};
        std::chrono::milliseconds max_delay{30000};
    };

    struct PollPolicy
    {
        std::chrono::milliseconds interval{2000};
        std::uint32_t max_attempts{150};
    };

    struct UploadSettings
    {
        std::uint64_t max_file_size{10ULL * 1024ULL * kMiB};
        std::uint64_t chunk_size{kDefaultChunkSize};
        std::vector<std::string> supported_formats{"mp4", "mov", "avi", "wmv", "flv", "mkv", "webm"};
        std::uint32_t upload_timeout_seconds{3600};
        std::string cors_origin{"*"};
        std::string playback_policy{"public"};
        std::string video_quality{"basic"};
        std::string static_rendition{"highest"};
        std::optional<std::string> title;
        bool reclaim_on_quota{true};
        RetryPolicy retry{};
        PollPolicy poll{};
        std::chrono::milliseconds progress_interval{10000};
        std::size_t progress_capacity{64};
    };

    struct StreamingSettings
    {
        std::string host{"stream.mux.com"};
        std::string default_mp4_rendition{"highest.mp4"};
    };

    struct AppSettings
    {
        ApiSettings api{};
        UploadSettings upload{};
        StreamingSettings streaming{};
    };

    const AppSettings &default_settings();

    // Throws Error(InvalidConfiguration) when a value is outside what the remote service accepts.
    void validate(const UploadSettings &settings);

    std::string_view content_type_for(std::string_view extension) noexcept;

} // namespace vidyeet
