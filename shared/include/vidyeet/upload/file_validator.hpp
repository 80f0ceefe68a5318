/**
 * vidyeet - Local file checks performed before any network traffic.
 */
#pragma once

#include <cstdint>
#include <filesystem>
#include <string>

#include "vidyeet/settings.hpp"

namespace vidyeet::upload
{

    struct FileHandle
    {
        std::filesystem::path path;
        std::string file_name;
        std::uint64_t size{};
        std::string format;
        std::string content_type;
    };

    // Throws Error with FileNotFound, NotAFile, FileTooLarge or UnsupportedFormat.
    FileHandle validate_upload_file(const std::filesystem::path &path, const UploadSettings &settings);

} // namespace vidyeet::upload
