#include "vidyeet/client/output.hpp"

#include <charconv>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <type_traits>
#include <variant>

#include "vidyeet/upload/asset_awaiter.hpp"
#include "vidyeet/version.hpp"

namespace vidyeet::client
{

    namespace
    {

        constexpr const char *kHelpText = R"(vidyeet - upload videos to Mux Video from the command line

Usage:
  vidyeet [--machine] [--verbose] [--log <file>] <command> [args...]

Global flags:
  --machine              Print one JSON object per line to stdout (success and failure)
  --verbose, -v          Print debug logging to stderr
  --log <file>           Append the log to <file>

Commands:
  login [--stdin]        Store an access token (Token ID and Token Secret)
                         --stdin: read the Token ID and Secret from two input lines
  logout                 Remove the stored access token
  status                 Check whether the stored token is accepted
  list                   List uploaded assets
  show <asset_id>        Show details of one asset
  delete <asset_id> [--force]
                         Delete an asset; --force skips the confirmation prompt
  upload <file> [options]
                         Upload a video file
      --progress               Report progress while uploading
      --chunk-size <MiB>       Size of each uploaded chunk (default 32)
      --title <text>           Title stored with the asset
      --timeout <seconds>      Validity of the signed upload URL (60..604800, default 3600)
      --no-reclaim             Fail instead of deleting the oldest asset when the plan limit is hit
      --progress-interval <s>  Minimum seconds between chunk progress reports (default 10)
  help                   Show this message
  version                Print the version

Exit codes:
  0 success, 1 invalid input, 2 configuration or authentication, 3 network or service,
  4 asset processing timed out, 130 cancelled)";

        nlohmann::json optional_json(const std::optional<std::string> &value)
        {
            return value ? nlohmann::json(*value) : nlohmann::json();
        }

        std::string format_duration(double seconds)
        {
            const auto total = static_cast<std::uint64_t>(seconds);
            std::ostringstream stream;
            stream << total / 60 << ':' << std::setw(2) << std::setfill('0') << total % 60;
            return stream.str();
        }

        // created_at is epoch seconds; anything else is shown verbatim.
        std::string format_timestamp(const std::string &created_at)
        {
            std::int64_t seconds = 0;
            const auto *end = created_at.data() + created_at.size();
            const auto [ptr, ec] = std::from_chars(created_at.data(), end, seconds);
            if (ec != std::errc() || ptr != end)
            {
                return created_at;
            }
            const auto time = static_cast<std::time_t>(seconds);
            std::tm utc{};
            if (gmtime_r(&time, &utc) == nullptr)
            {
                return created_at;
            }
            std::ostringstream stream;
            stream << std::put_time(&utc, "%Y-%m-%d %H:%M:%S UTC");
            return stream.str();
        }

        nlohmann::json asset_summary(const protocol::Asset &asset, const StreamingSettings &streaming)
        {
            const auto resolved = upload::resolve_asset(asset, streaming);
            return {
                {"asset_id", asset.id},
                {"status", asset.status},
                {"duration", asset.duration ? nlohmann::json(*asset.duration) : nlohmann::json()},
                {"aspect_ratio", optional_json(asset.aspect_ratio)},
                {"created_at", asset.created_at},
                {"playback_id", optional_json(resolved.playback_id)},
                {"hls_url", optional_json(resolved.hls_url)},
                {"mp4_url", optional_json(resolved.mp4_url)},
            };
        }

    } // namespace

    std::string help_text()
    {
        return kHelpText;
    }

    std::string format_megabytes(std::uint64_t bytes)
    {
        std::ostringstream stream;
        stream << std::fixed << std::setprecision(2) << static_cast<double>(bytes) / 1048576.0 << " MB";
        return stream.str();
    }

    Output::Output(bool machine, std::ostream &out, std::ostream &err) : machine_(machine), out_(out), err_(err) {}

    void Output::write_json(const nlohmann::json &json)
    {
        out_ << json.dump() << std::endl;
    }

    void Output::progress(const upload::ProgressEvent &event)
    {
        if (machine_)
        {
            write_json({{"progress", event}});
            return;
        }

        namespace events = upload::events;
        std::visit(
            [this](const auto &data)
            {
                using T = std::decay_t<decltype(data)>;
                if constexpr (std::is_same_v<T, events::ValidatingFile>)
                {
                    err_ << "Validating file: " << data.file_path << std::endl;
                }
                else if constexpr (std::is_same_v<T, events::FileValidated>)
                {
                    err_ << "File validated: " << data.file_name << " (" << format_megabytes(data.size_bytes) << ", "
                         << data.format << ")" << std::endl;
                }
                else if constexpr (std::is_same_v<T, events::CreatingTarget>)
                {
                    err_ << "Creating upload session for: " << data.file_name << std::endl;
                }
                else if constexpr (std::is_same_v<T, events::TargetCreated>)
                {
                    err_ << "Upload session created (ID: " << data.upload_id << ")" << std::endl;
                }
                else if constexpr (std::is_same_v<T, events::UploadStarted>)
                {
                    err_ << "Uploading file: " << data.file_name << " (" << format_megabytes(data.size_bytes) << ", "
                         << data.total_chunks << " chunk" << (data.total_chunks == 1 ? "" : "s") << ")..."
                         << std::endl;
                }
                else if constexpr (std::is_same_v<T, events::ChunkCompleted>)
                {
                    const auto percent = data.total_bytes == 0 ? 100.0
                                                               : 100.0 * static_cast<double>(data.bytes_sent) /
                                                                     static_cast<double>(data.total_bytes);
                    err_ << "  chunk " << data.current_chunk << "/" << data.total_chunks << "  "
                         << format_megabytes(data.bytes_sent) << " / " << format_megabytes(data.total_bytes) << " ("
                         << std::fixed << std::setprecision(1) << percent << "%)" << std::defaultfloat << std::endl;
                }
                else if constexpr (std::is_same_v<T, events::UploadFinished>)
                {
                    err_ << "File uploaded: " << data.file_name << " (" << format_megabytes(data.size_bytes) << ")"
                         << std::endl;
                }
                else if constexpr (std::is_same_v<T, events::AwaitingAsset>)
                {
                    if (data.elapsed_secs > 0 && data.elapsed_secs % 10 == 0)
                    {
                        err_ << "Still waiting... (" << data.elapsed_secs << "s elapsed)" << std::endl;
                    }
                    else if (data.elapsed_secs < 10 && !waiting_announced_)
                    {
                        err_ << "Waiting for asset creation..." << std::endl;
                    }
                    waiting_announced_ = true;
                }
                else if constexpr (std::is_same_v<T, events::Completed>)
                {
                    err_ << "Asset created: " << data.asset_id << std::endl;
                }
                else if constexpr (std::is_same_v<T, events::Failed>)
                {
                    err_ << "Upload failed during " << (data.step.empty() ? "upload" : data.step) << std::endl;
                }
            },
            event.payload);
    }

    void Output::login(bool was_logged_in)
    {
        if (machine_)
        {
            write_json({{"success", true},
                        {"command", "login"},
                        {"was_logged_in", was_logged_in},
                        {"action", was_logged_in ? "updated" : "created"}});
            return;
        }
        err_ << std::endl;
        if (was_logged_in)
        {
            err_ << "Login credentials updated!" << std::endl;
            err_ << "New authentication credentials have been saved." << std::endl;
        }
        else
        {
            err_ << "Login successful." << std::endl;
            err_ << "Authentication credentials have been saved." << std::endl;
        }
    }

    void Output::logout(bool was_logged_in)
    {
        if (machine_)
        {
            write_json({{"success", true}, {"command", "logout"}, {"was_logged_in", was_logged_in}});
            return;
        }
        if (was_logged_in)
        {
            err_ << "Logged out successfully." << std::endl;
            err_ << "Authentication credentials have been removed." << std::endl;
        }
        else
        {
            err_ << "Already logged out." << std::endl;
        }
    }

    void Output::status(bool authenticated, const std::optional<std::string> &masked_token_id)
    {
        if (machine_)
        {
            write_json({{"success", true},
                        {"command", "status"},
                        {"is_authenticated", authenticated},
                        {"token_id", optional_json(masked_token_id)}});
            return;
        }
        err_ << std::endl;
        if (authenticated)
        {
            err_ << "Authenticated" << std::endl;
            if (masked_token_id)
            {
                err_ << "Token ID: " << *masked_token_id << std::endl;
            }
            err_ << std::endl << "Your credentials are valid and working." << std::endl;
        }
        else if (masked_token_id)
        {
            err_ << "Authentication failed" << std::endl;
            err_ << "  Token ID: " << *masked_token_id << std::endl << std::endl;
            err_ << "Your credentials may be invalid or expired." << std::endl;
            err_ << "Please run 'vidyeet login' to update your credentials." << std::endl;
        }
        else
        {
            err_ << "Not logged in" << std::endl;
            err_ << "No authentication credentials found." << std::endl;
            err_ << "Please run 'vidyeet login' to authenticate." << std::endl;
        }
    }

    void Output::asset_list(const protocol::AssetList &list, const StreamingSettings &streaming)
    {
        if (machine_)
        {
            auto videos = nlohmann::json::array();
            for (const auto &asset : list.data)
            {
                videos.push_back(asset_summary(asset, streaming));
            }
            write_json({{"success", true},
                        {"command", "list"},
                        {"videos", std::move(videos)},
                        {"total_count", list.data.size()}});
            return;
        }
        err_ << std::endl;
        if (list.data.empty())
        {
            err_ << "No videos found." << std::endl;
            err_ << "Upload your first video with 'vidyeet upload <file>'" << std::endl;
            return;
        }
        err_ << "Found " << list.data.size() << " video(s):" << std::endl << std::endl;
        std::size_t number = 0;
        for (const auto &asset : list.data)
        {
            const auto resolved = upload::resolve_asset(asset, streaming);
            err_ << "---" << std::endl;
            err_ << "Video #" << ++number << std::endl;
            err_ << "Asset ID: " << asset.id << std::endl;
            err_ << "Status: " << asset.status << std::endl;
            if (asset.duration)
            {
                err_ << "Duration: " << format_duration(*asset.duration) << std::endl;
            }
            if (asset.aspect_ratio)
            {
                err_ << "Aspect Ratio: " << *asset.aspect_ratio << std::endl;
            }
            if (resolved.hls_url)
            {
                err_ << "HLS URL: " << *resolved.hls_url << std::endl;
            }
            if (resolved.mp4_url && resolved.mp4_status == upload::Mp4Status::Ready)
            {
                err_ << "MP4 URL: " << *resolved.mp4_url << std::endl;
            }
            err_ << "Created: " << format_timestamp(asset.created_at) << std::endl << std::endl;
        }
        err_ << "---" << std::endl;
    }

    void Output::asset_detail(const protocol::Asset &asset, const StreamingSettings &streaming)
    {
        const auto resolved = upload::resolve_asset(asset, streaming);
        if (machine_)
        {
            auto tracks = nlohmann::json::array();
            for (const auto &track : asset.tracks)
            {
                tracks.push_back({{"type", track.type},
                                  {"duration", track.duration ? nlohmann::json(*track.duration) : nlohmann::json()}});
            }
            write_json({{"success", true},
                        {"command", "show"},
                        {"asset_id", asset.id},
                        {"status", asset.status},
                        {"duration", asset.duration ? nlohmann::json(*asset.duration) : nlohmann::json()},
                        {"aspect_ratio", optional_json(asset.aspect_ratio)},
                        {"video_quality", optional_json(asset.video_quality)},
                        {"created_at", asset.created_at},
                        {"playback_ids", asset.playback_ids},
                        {"hls_url", optional_json(resolved.hls_url)},
                        {"mp4_url", optional_json(resolved.mp4_url)},
                        {"mp4_status", upload::to_string(resolved.mp4_status)},
                        {"tracks", std::move(tracks)},
                        {"static_renditions", asset.static_renditions}});
            return;
        }

        err_ << std::endl << "Asset Details:" << std::endl << "==============" << std::endl;
        err_ << "Asset ID:       " << asset.id << std::endl;
        err_ << "Status:         " << asset.status << std::endl;
        if (asset.duration)
        {
            err_ << "Duration:       " << format_duration(*asset.duration) << " (" << std::fixed
                 << std::setprecision(2) << *asset.duration << "s)" << std::defaultfloat << std::endl;
        }
        if (asset.aspect_ratio)
        {
            err_ << "Aspect Ratio:   " << *asset.aspect_ratio << std::endl;
        }
        if (asset.video_quality)
        {
            err_ << "Video Quality:  " << *asset.video_quality << std::endl;
        }
        err_ << "Created At:     " << format_timestamp(asset.created_at) << std::endl;

        err_ << std::endl << "Playback Information:" << std::endl << "--------------------" << std::endl;
        if (asset.playback_ids.empty())
        {
            err_ << "No playback IDs available" << std::endl;
        }
        for (std::size_t i = 0; i < asset.playback_ids.size(); ++i)
        {
            err_ << "Playback ID #" << i + 1 << ": " << asset.playback_ids[i].id << std::endl;
            err_ << "  Policy:       " << asset.playback_ids[i].policy << std::endl;
        }
        if (resolved.hls_url)
        {
            err_ << "HLS URL:        " << *resolved.hls_url << std::endl;
        }
        if (resolved.mp4_url)
        {
            err_ << "MP4 URL:        " << *resolved.mp4_url << " (" << upload::to_string(resolved.mp4_status) << ")"
                 << std::endl;
        }

        if (!asset.tracks.empty())
        {
            err_ << std::endl << "Tracks:" << std::endl << "-------" << std::endl;
            for (const auto &track : asset.tracks)
            {
                err_ << "Type: " << track.type;
                if (track.duration)
                {
                    err_ << "  Duration: " << format_duration(*track.duration);
                }
                err_ << std::endl;
            }
        }

        if (!asset.static_renditions.empty())
        {
            err_ << std::endl << "Static Renditions:" << std::endl << "------------------" << std::endl;
            for (std::size_t i = 0; i < asset.static_renditions.size(); ++i)
            {
                const auto &rendition = asset.static_renditions[i];
                err_ << "Rendition #" << i + 1 << ": " << rendition.name << std::endl;
                err_ << "  Status:       " << rendition.status << std::endl;
                err_ << "  Resolution:   " << rendition.resolution << std::endl;
                err_ << "  Type:         " << rendition.type << std::endl;
                err_ << "  Format:       " << rendition.ext << std::endl;
            }
        }
        err_ << std::endl;
    }

    void Output::deleted(const std::string &asset_id)
    {
        if (machine_)
        {
            write_json({{"success", true}, {"command", "delete"}, {"asset_id", asset_id}});
            return;
        }
        err_ << std::endl << "Asset deleted successfully!" << std::endl;
        err_ << "Asset ID: " << asset_id << std::endl << std::endl;
        err_ << "The video and all its data have been permanently removed." << std::endl;
    }

    void Output::delete_declined(const std::string &asset_id)
    {
        if (machine_)
        {
            write_json({{"success", true}, {"command", "delete"}, {"asset_id", asset_id}, {"deleted", false}});
            return;
        }
        err_ << "Deletion cancelled." << std::endl;
    }

    void Output::upload(const upload::UploadResult &result)
    {
        if (machine_)
        {
            nlohmann::json json = result;
            json["success"] = true;
            json["command"] = "upload";
            write_json(json);
            return;
        }
        err_ << std::endl << "Upload completed successfully!" << std::endl << "---" << std::endl;
        err_ << "Asset ID: " << result.asset_id << std::endl;
        if (result.hls_url)
        {
            err_ << std::endl << "HLS Streaming URL:" << std::endl << *result.hls_url << std::endl;
        }
        err_ << std::endl << "MP4 Download URL:" << std::endl;
        if (result.mp4_url)
        {
            err_ << *result.mp4_url << std::endl;
            if (result.mp4_status == upload::Mp4Status::Generating)
            {
                err_ << "(MP4 is still being generated in the background.)" << std::endl;
                err_ << "The URL above will be available once generation completes." << std::endl;
                err_ << "You can start streaming with HLS URL immediately!" << std::endl;
            }
        }
        else
        {
            err_ << "(not available)" << std::endl;
        }
        err_ << "---" << std::endl;
        if (result.deleted_old_assets > 0)
        {
            err_ << "Note: deleted " << result.deleted_old_assets
                 << " old video(s) to stay within the plan limit." << std::endl;
        }
    }

    void Output::help()
    {
        if (machine_)
        {
            write_json({{"success", true}, {"command", "help"}, {"usage", help_text()}});
            return;
        }
        err_ << help_text() << std::endl;
    }

    void Output::version()
    {
        if (machine_)
        {
            write_json({{"success", true}, {"command", "version"}, {"version", vidyeet::version()}});
            return;
        }
        err_ << "vidyeet " << vidyeet::version() << std::endl;
    }

    void Output::failure(const Error &error)
    {
        const auto hint = remediation_hint(error.code());
        const auto code = exit_code(error.category());
        if (machine_)
        {
            write_json({{"success", false},
                        {"error",
                         {{"category", to_string(error.category())},
                          {"code", to_string(error.code())},
                          {"step", error.step()},
                          {"message", error.detail()},
                          {"hint", hint ? nlohmann::json(*hint) : nlohmann::json()}}},
                        {"exit_code", code}});
            return;
        }
        err_ << "ERROR: " << error.what() << " [" << to_string(error.code()) << "]" << std::endl;
        if (hint)
        {
            err_ << "Hint: " << *hint << std::endl;
        }
    }

} // namespace vidyeet::client
