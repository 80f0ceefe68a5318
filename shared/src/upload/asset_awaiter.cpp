#include "vidyeet/upload/asset_awaiter.hpp"

#include <thread>

#include <spdlog/spdlog.h>

#include "vidyeet/cancellation.hpp"
#include "vidyeet/error_codes.hpp"
#include "vidyeet/upload/progress.hpp"

namespace vidyeet::upload
{

    namespace
    {

        bool is_failed_upload_status(const std::string &status)
        {
            return status == "errored" || status == "cancelled" || status == "timed_out";
        }

        std::string join_messages(const std::vector<std::string> &messages)
        {
            std::string joined;
            for (const auto &message : messages)
            {
                joined += (joined.empty() ? "" : "; ") + message;
            }
            return joined.empty() ? "no details reported" : joined;
        }

    } // namespace

    std::string_view to_string(AwaitState state) noexcept
    {
        switch (state)
        {
        case AwaitState::Polling:
            return "polling";
        case AwaitState::Ready:
            return "ready";
        case AwaitState::Errored:
            return "errored";
        case AwaitState::TimedOut:
            return "timed_out";
        case AwaitState::Cancelled:
            return "cancelled";
        }
        return "polling";
    }

    std::string_view to_string(Mp4Status status) noexcept
    {
        return status == Mp4Status::Ready ? "ready" : "generating";
    }

    ResolvedAsset resolve_asset(const protocol::Asset &asset, const StreamingSettings &streaming)
    {
        ResolvedAsset resolved{
            .asset_id = asset.id,
            .playback_id = asset.first_playback_id(),
            .hls_url = std::nullopt,
            .mp4_url = std::nullopt,
            .mp4_status = Mp4Status::Generating,
            .asset = asset,
        };
        if (!resolved.playback_id)
        {
            return resolved;
        }
        resolved.hls_url = protocol::hls_url(streaming.host, *resolved.playback_id);
        if (const auto *rendition = asset.ready_mp4_rendition())
        {
            resolved.mp4_url = protocol::mp4_url(streaming.host, *resolved.playback_id, rendition->name);
            resolved.mp4_status = Mp4Status::Ready;
        }
        else
        {
            // Static renditions finish after the asset itself; the URL becomes valid once they do.
            resolved.mp4_url = protocol::mp4_url(streaming.host, *resolved.playback_id, streaming.default_mp4_rendition);
        }
        return resolved;
    }

    AssetAwaiter::AssetAwaiter(ApiClient &api, PollPolicy policy, StreamingSettings streaming,
                               const CancellationToken *cancel, ProgressEmitter *emitter)
        : api_(api), policy_(policy), streaming_(std::move(streaming)), cancel_(cancel), emitter_(emitter) {}

    void AssetAwaiter::pause()
    {
        if (cancel_)
        {
            if (cancel_->wait_for(policy_.interval))
            {
                state_ = AwaitState::Cancelled;
                throw Error(ErrorCode::Cancelled, "cancelled while waiting for the asset");
            }
            return;
        }
        std::this_thread::sleep_for(policy_.interval);
    }

    std::optional<protocol::Asset> AssetAwaiter::poll_once(const std::string &upload_id)
    {
        if (!asset_id_)
        {
            const auto upload = api_.get_direct_upload(upload_id);
            if (is_failed_upload_status(upload.status))
            {
                state_ = AwaitState::Errored;
                const auto detail = upload.error ? upload.error->message : std::string("no details reported");
                throw Error(ErrorCode::AssetErrored, "upload " + upload_id + " " + upload.status + ": " + detail);
            }
            if (!upload.asset_id)
            {
                spdlog::debug("Upload {} is {}, no asset yet", upload_id, upload.status);
                return std::nullopt;
            }
            asset_id_ = upload.asset_id;
            spdlog::info("Upload {} created asset {}", upload_id, *asset_id_);
        }

        auto asset = api_.get_asset(*asset_id_);
        switch (asset.asset_status())
        {
        case protocol::AssetStatus::Ready:
            return asset;
        case protocol::AssetStatus::Errored:
            state_ = AwaitState::Errored;
            throw Error(ErrorCode::AssetErrored,
                        "asset " + asset.id + " failed processing: " + join_messages(asset.error_messages));
        case protocol::AssetStatus::Preparing:
            break;
        }
        spdlog::debug("Asset {} is {}", asset.id, asset.status);
        return std::nullopt;
    }

    ResolvedAsset AssetAwaiter::wait(const std::string &upload_id)
    {
        state_ = AwaitState::Polling;
        attempts_ = 0;
        asset_id_.reset();

        while (attempts_ < policy_.max_attempts)
        {
            ++attempts_;
            pause();
            if (emitter_)
            {
                const auto elapsed = policy_.interval * attempts_;
                emitter_->emit(events::AwaitingAsset{
                    .upload_id = upload_id,
                    .elapsed_secs = static_cast<std::uint64_t>(
                        std::chrono::duration_cast<std::chrono::seconds>(elapsed).count()),
                });
            }

            try
            {
                if (auto asset = poll_once(upload_id))
                {
                    state_ = AwaitState::Ready;
                    spdlog::info("Asset {} ready after {} polls", asset->id, attempts_);
                    return resolve_asset(*asset, streaming_);
                }
            }
            catch (const Error &ex)
            {
                if (ex.code() == ErrorCode::Cancelled)
                {
                    state_ = AwaitState::Cancelled;
                    throw;
                }
                if (!is_retryable(ex.code()))
                {
                    throw;
                }
                spdlog::warn("Poll {}/{} failed: {}", attempts_, policy_.max_attempts, ex.what());
            }
        }

        state_ = AwaitState::TimedOut;
        throw Error(ErrorCode::AssetTimedOut, "asset for upload " + upload_id + " not ready after " +
                                                  std::to_string(attempts_) + " polls");
    }

} // namespace vidyeet::upload
