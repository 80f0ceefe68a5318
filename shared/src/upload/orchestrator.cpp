#include "vidyeet/upload/orchestrator.hpp"

#include <exception>

#include <spdlog/spdlog.h>

#include "vidyeet/cancellation.hpp"
#include "vidyeet/error_codes.hpp"
#include "vidyeet/upload/chunk_planner.hpp"

namespace vidyeet::upload
{

    namespace
    {

        template <typename Fn>
        auto run_step(const std::string &step, Fn &&fn) -> decltype(fn())
        {
            try
            {
                return fn();
            }
            catch (const Error &ex)
            {
                if (!ex.step().empty())
                {
                    throw;
                }
                throw ex.with_step(step);
            }
            catch (const std::exception &ex)
            {
                throw Error(ErrorCode::InternalError, ex.what(), step);
            }
        }

    } // namespace

    void to_json(nlohmann::json &json, const UploadResult &result)
    {
        json = {
            {"asset_id", result.asset_id},
            {"playback_id", result.playback_id ? nlohmann::json(*result.playback_id) : nlohmann::json()},
            {"hls_url", result.hls_url ? nlohmann::json(*result.hls_url) : nlohmann::json()},
            {"mp4_url", result.mp4_url ? nlohmann::json(*result.mp4_url) : nlohmann::json()},
            {"mp4_status", to_string(result.mp4_status)},
            {"file_path", result.file_path},
            {"file_size", result.file_size},
            {"file_format", result.file_format},
            {"bytes_sent", result.bytes_sent},
            {"total_chunks", result.total_chunks},
            {"deleted_old_assets", result.deleted_old_assets},
        };
    }

    UploadOrchestrator::UploadOrchestrator(http::Transport &transport, AppSettings settings,
                                           CredentialLookup credentials, ProgressChannel *channel,
                                           const CancellationToken &cancel, SteadyClock clock)
        : transport_(transport),
          settings_(std::move(settings)),
          credentials_(std::move(credentials)),
          cancel_(cancel),
          emitter_(channel, settings_.upload.progress_interval, std::move(clock)) {}

    protocol::DirectUploadRequest UploadOrchestrator::build_upload_request(const FileHandle &file) const
    {
        const auto &upload = settings_.upload;
        protocol::DirectUploadRequest request;
        request.cors_origin = upload.cors_origin;
        request.timeout = upload.upload_timeout_seconds;
        request.new_asset_settings.playback_policies = {upload.playback_policy};
        request.new_asset_settings.video_quality = upload.video_quality;
        if (!upload.static_rendition.empty())
        {
            request.new_asset_settings.static_rendition_resolutions = {upload.static_rendition};
        }
        protocol::AssetMeta meta;
        meta.title = upload.title ? *upload.title : file.file_name;
        request.new_asset_settings.meta = meta;
        return request;
    }

    UploadSession UploadOrchestrator::create_target(ApiClient &api, const FileHandle &file, UploadResult &result)
    {
        const auto request = build_upload_request(file);
        protocol::DirectUpload upload;
        try
        {
            upload = api.create_direct_upload(request);
        }
        catch (const Error &ex)
        {
            if (ex.code() != ErrorCode::QuotaExceeded || !settings_.upload.reclaim_on_quota)
            {
                throw;
            }
            spdlog::warn("Asset quota reached, deleting the oldest asset: {}", ex.detail());
            const auto deleted = api.delete_oldest_asset();
            if (!deleted)
            {
                throw;
            }
            ++result.deleted_old_assets;
            // A second quota rejection propagates as is.
            upload = api.create_direct_upload(request);
        }

        spdlog::info("Created direct upload {}", upload.id);
        return UploadSession{
            .upload_id = upload.id,
            .url = upload.url.value_or(std::string{}),
            .timeout_seconds = upload.timeout,
        };
    }

    void UploadOrchestrator::transfer(const FileHandle &file, const ChunkPlan &plan, const UploadSession &session)
    {
        ChunkSource source(file.path);
        TransferExecutor executor(transport_, settings_.upload.retry, &cancel_, &emitter_);
        const auto total_chunks = static_cast<std::uint32_t>(plan.size());
        try
        {
            for (auto index = transfer_state_.next_index(); index < total_chunks; ++index)
            {
                executor.send(plan.ranges[index], total_chunks, session, source, file.content_type, transfer_state_);
            }
        }
        catch (const Error &)
        {
            chunk_requests_ += executor.total_requests();
            spdlog::debug("Transfer stopped after {} attempts on the failing chunk", executor.attempts_for_last_chunk());
            throw;
        }
        chunk_requests_ += executor.total_requests();
    }

    UploadResult UploadOrchestrator::run(const std::filesystem::path &path)
    {
        emitter_.reset();
        transfer_state_ = TransferState{};
        chunk_requests_ = 0;
        poll_attempts_ = 0;

        UploadResult result;
        try
        {
            emitter_.emit(events::ValidatingFile{.file_path = path.string()});
            const auto file = run_step("validate", [&]()
                                       {
                                           validate(settings_.upload);
                                           return validate_upload_file(path, settings_.upload); });
            result.file_path = file.path.string();
            result.file_size = file.size;
            result.file_format = file.format;
            emitter_.emit(events::FileValidated{
                .file_name = file.file_name,
                .size_bytes = file.size,
                .format = file.format,
            });

            auto credentials = run_step("credentials", [&]()
                                        {
                                            std::optional<Credentials> found;
                                            if (credentials_)
                                            {
                                                found = credentials_();
                                            }
                                            if (!found)
                                            {
                                                throw Error(ErrorCode::CredentialsMissing, "no credentials configured");
                                            }
                                            return *found; });
            ApiClient api(transport_, settings_.api.endpoint, std::move(credentials), &cancel_);

            emitter_.emit(events::CreatingTarget{.file_name = file.file_name});
            const auto session = run_step("create_target", [&]()
                                          { return create_target(api, file, result); });
            emitter_.emit(events::TargetCreated{.upload_id = session.upload_id});

            const auto plan = run_step("plan", [&]()
                                       { return plan_chunks(file.size, settings_.upload.chunk_size); });
            result.total_chunks = static_cast<std::uint32_t>(plan.size());
            emitter_.emit(events::UploadStarted{
                .file_name = file.file_name,
                .size_bytes = file.size,
                .total_chunks = result.total_chunks,
            });

            run_step("transfer", [&]()
                     { transfer(file, plan, session); });
            result.bytes_sent = transfer_state_.bytes_acknowledged;
            emitter_.emit(events::UploadFinished{.file_name = file.file_name, .size_bytes = file.size});

            AssetAwaiter awaiter(api, settings_.upload.poll, settings_.streaming, &cancel_, &emitter_);
            const auto resolved = run_step("await_asset", [&]()
                                           {
                                               try
                                               {
                                                   auto ready = awaiter.wait(session.upload_id);
                                                   poll_attempts_ = awaiter.attempts();
                                                   return ready;
                                               }
                                               catch (const Error &)
                                               {
                                                   poll_attempts_ = awaiter.attempts();
                                                   throw;
                                               } });
            result.asset_id = resolved.asset_id;
            result.playback_id = resolved.playback_id;
            result.hls_url = resolved.hls_url;
            result.mp4_url = resolved.mp4_url;
            result.mp4_status = resolved.mp4_status;

            emitter_.emit(events::Completed{.asset_id = result.asset_id});
        }
        catch (const Error &ex)
        {
            spdlog::error("Upload of {} failed: {}", path.string(), ex.what());
            emitter_.emit(events::Failed{
                .category = ex.category(),
                .code = ex.code(),
                .step = ex.step(),
                .message = ex.detail(),
            });
            emitter_.close();
            throw;
        }
        catch (const std::exception &ex)
        {
            Error wrapped(ErrorCode::InternalError, ex.what());
            emitter_.emit(events::Failed{
                .category = wrapped.category(),
                .code = wrapped.code(),
                .step = {},
                .message = wrapped.detail(),
            });
            emitter_.close();
            throw wrapped;
        }

        emitter_.close();
        spdlog::info("Uploaded {} as asset {}", result.file_path, result.asset_id);
        spdlog::debug("{} chunk progress events reported", emitter_.chunk_events_emitted());
        return result;
    }

} // namespace vidyeet::upload
