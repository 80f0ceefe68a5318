#include "vidyeet/settings.hpp"

#include <array>
#include <string>

#include "vidyeet/error_codes.hpp"

namespace vidyeet
{

    namespace
    {
        struct ContentTypeMapping
        {
            std::string_view extension;
            std::string_view content_type;
        };

        constexpr std::array<ContentTypeMapping, 7> kContentTypes{{
            {"mp4", "video/mp4"},
            {"mov", "video/quicktime"},
            {"avi", "video/x-msvideo"},
            {"wmv", "video/x-ms-wmv"},
            {"flv", "video/x-flv"},
            {"mkv", "video/x-matroska"},
            {"webm", "video/webm"},
        }};
    } // namespace

    const AppSettings &default_settings()
    {
        static const AppSettings settings{};
        return settings;
    }

    void validate(const UploadSettings &settings)
    {
        if (settings.chunk_size == 0 || settings.chunk_size % kChunkGranularity != 0)
        {
            throw Error(ErrorCode::InvalidConfiguration,
                        "chunk size " + std::to_string(settings.chunk_size) + " must be a positive multiple of " +
                            std::to_string(kChunkGranularity) + " bytes");
        }
        if (settings.upload_timeout_seconds < kMinUploadTimeoutSeconds ||
            settings.upload_timeout_seconds > kMaxUploadTimeoutSeconds)
        {
            throw Error(ErrorCode::InvalidConfiguration,
                        "upload timeout must be between " + std::to_string(kMinUploadTimeoutSeconds) + " and " +
                            std::to_string(kMaxUploadTimeoutSeconds) + " seconds");
        }
        if (settings.retry.max_attempts == 0)
        {
            throw Error(ErrorCode::InvalidConfiguration, "retry policy needs at least one attempt");
        }
        if (settings.poll.max_attempts == 0)
        {
            throw Error(ErrorCode::InvalidConfiguration, "poll policy needs at least one attempt");
        }
        if (settings.progress_capacity == 0)
        {
            throw Error(ErrorCode::InvalidConfiguration, "progress channel capacity must be positive");
        }
    }

    std::string_view content_type_for(std::string_view extension) noexcept
    {
        for (const auto &mapping : kContentTypes)
        {
            if (mapping.extension == extension)
            {
                return mapping.content_type;
            }
        }
        return "application/octet-stream";
    }

} // namespace vidyeet
