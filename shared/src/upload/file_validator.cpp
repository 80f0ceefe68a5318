#include "vidyeet/upload/file_validator.hpp"

#include <algorithm>
#include <cctype>
#include <system_error>

#include "vidyeet/error_codes.hpp"

namespace vidyeet::upload
{

    namespace
    {

        std::string supported_list(const UploadSettings &settings)
        {
            std::string joined;
            for (const auto &format : settings.supported_formats)
            {
                joined += (joined.empty() ? "" : ", ") + format;
            }
            return joined;
        }

    } // namespace

    FileHandle validate_upload_file(const std::filesystem::path &path, const UploadSettings &settings)
    {
        std::error_code ec;
        const auto status = std::filesystem::status(path, ec);
        if (ec || !std::filesystem::exists(status))
        {
            throw Error(ErrorCode::FileNotFound, "file not found: " + path.string());
        }
        if (!std::filesystem::is_regular_file(status))
        {
            throw Error(ErrorCode::NotAFile, "'" + path.string() + "' is not a regular file");
        }

        const auto size = std::filesystem::file_size(path, ec);
        if (ec)
        {
            throw Error(ErrorCode::FileIo, "cannot read size of " + path.string() + ": " + ec.message());
        }
        if (size > settings.max_file_size)
        {
            throw Error(ErrorCode::FileTooLarge, "file too large: " + std::to_string(size) +
                                                     " bytes (maximum allowed: " +
                                                     std::to_string(settings.max_file_size) + " bytes)");
        }

        auto extension = path.extension().string();
        if (!extension.empty() && extension.front() == '.')
        {
            extension.erase(0, 1);
        }
        std::transform(extension.begin(), extension.end(), extension.begin(), [](unsigned char ch)
                       { return static_cast<char>(std::tolower(ch)); });
        if (extension.empty())
        {
            throw Error(ErrorCode::UnsupportedFormat,
                        path.string() + " has no extension (expected one of: " + supported_list(settings) + ")");
        }
        if (std::find(settings.supported_formats.begin(), settings.supported_formats.end(), extension) ==
            settings.supported_formats.end())
        {
            throw Error(ErrorCode::UnsupportedFormat, "unsupported format '" + extension + "' for " + path.string() +
                                                          " (expected one of: " + supported_list(settings) + ")");
        }

        return FileHandle{
            .path = path,
            .file_name = path.filename().string(),
            .size = size,
            .format = extension,
            .content_type = std::string(content_type_for(extension)),
        };
    }

} // namespace vidyeet::upload
