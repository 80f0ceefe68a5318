#include "vidyeet/upload/progress.hpp"

#include <algorithm>
#include <array>
#include <type_traits>

namespace vidyeet::upload
{

    namespace
    {

        struct PhaseMapping
        {
            Phase phase;
            std::string_view label;
        };

        constexpr std::array<PhaseMapping, 10> kPhaseMappings{{
            {Phase::ValidatingFile, "validating_file"},
            {Phase::FileValidated, "file_validated"},
            {Phase::CreatingTarget, "creating_target"},
            {Phase::TargetCreated, "target_created"},
            {Phase::UploadStarted, "upload_started"},
            {Phase::ChunkCompleted, "chunk_completed"},
            {Phase::UploadFinished, "upload_finished"},
            {Phase::AwaitingAsset, "awaiting_asset"},
            {Phase::Completed, "completed"},
            {Phase::Failed, "failed"},
        }};

    } // namespace

    std::string_view to_string(Phase phase) noexcept
    {
        for (const auto &mapping : kPhaseMappings)
        {
            if (mapping.phase == phase)
            {
                return mapping.label;
            }
        }
        return "unknown";
    }

    Phase ProgressEvent::phase() const noexcept
    {
        // Variant alternatives are declared in Phase order.
        return static_cast<Phase>(payload.index());
    }

    void to_json(nlohmann::json &json, const ProgressEvent &event)
    {
        json = {{"phase", to_string(event.phase())}};
        std::visit(
            [&json](const auto &data)
            {
                using T = std::decay_t<decltype(data)>;
                if constexpr (std::is_same_v<T, events::ValidatingFile>)
                {
                    json["file_path"] = data.file_path;
                }
                else if constexpr (std::is_same_v<T, events::FileValidated>)
                {
                    json["file_name"] = data.file_name;
                    json["size_bytes"] = data.size_bytes;
                    json["format"] = data.format;
                }
                else if constexpr (std::is_same_v<T, events::CreatingTarget>)
                {
                    json["file_name"] = data.file_name;
                }
                else if constexpr (std::is_same_v<T, events::TargetCreated>)
                {
                    json["upload_id"] = data.upload_id;
                }
                else if constexpr (std::is_same_v<T, events::UploadStarted>)
                {
                    json["file_name"] = data.file_name;
                    json["size_bytes"] = data.size_bytes;
                    json["total_chunks"] = data.total_chunks;
                }
                else if constexpr (std::is_same_v<T, events::ChunkCompleted>)
                {
                    json["current_chunk"] = data.current_chunk;
                    json["total_chunks"] = data.total_chunks;
                    json["bytes_sent"] = data.bytes_sent;
                    json["total_bytes"] = data.total_bytes;
                }
                else if constexpr (std::is_same_v<T, events::UploadFinished>)
                {
                    json["file_name"] = data.file_name;
                    json["size_bytes"] = data.size_bytes;
                }
                else if constexpr (std::is_same_v<T, events::AwaitingAsset>)
                {
                    json["upload_id"] = data.upload_id;
                    json["elapsed_secs"] = data.elapsed_secs;
                }
                else if constexpr (std::is_same_v<T, events::Completed>)
                {
                    json["asset_id"] = data.asset_id;
                }
                else if constexpr (std::is_same_v<T, events::Failed>)
                {
                    json["category"] = to_string(data.category);
                    json["code"] = to_string(data.code);
                    json["step"] = data.step;
                    json["message"] = data.message;
                }
            },
            event.payload);
    }

    ProgressThrottle::ProgressThrottle(std::chrono::milliseconds min_interval, SteadyClock clock)
        : min_interval_(min_interval), clock_(std::move(clock)) {}

    std::chrono::steady_clock::time_point ProgressThrottle::now() const
    {
        return clock_ ? clock_() : std::chrono::steady_clock::now();
    }

    bool ProgressThrottle::admit(const events::ChunkCompleted &chunk)
    {
        const auto current = now();
        const bool boundary = chunk.current_chunk <= 1 || chunk.current_chunk >= chunk.total_chunks;
        if (!boundary && last_emitted_ && current - *last_emitted_ < min_interval_)
        {
            return false;
        }
        last_emitted_ = current;
        return true;
    }

    void ProgressThrottle::reset()
    {
        last_emitted_.reset();
    }

    ProgressChannel::ProgressChannel(std::size_t capacity) : capacity_(std::max<std::size_t>(capacity, 1)) {}

    void ProgressChannel::push(ProgressEvent event)
    {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (closed_)
            {
                return;
            }
            if (queue_.size() >= capacity_)
            {
                auto victim = std::find_if(queue_.begin(), queue_.end(), [](const ProgressEvent &queued)
                                           { return queued.droppable; });
                if (victim != queue_.end())
                {
                    queue_.erase(victim);
                    ++dropped_;
                }
                else if (event.droppable)
                {
                    ++dropped_;
                    return;
                }
            }
            queue_.push_back(std::move(event));
        }
        cv_.notify_one();
    }

    std::optional<ProgressEvent> ProgressChannel::pop()
    {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait(lock, [this]()
                 { return !queue_.empty() || closed_; });
        if (queue_.empty())
        {
            return std::nullopt;
        }
        auto event = std::move(queue_.front());
        queue_.pop_front();
        return event;
    }

    std::optional<ProgressEvent> ProgressChannel::try_pop()
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (queue_.empty())
        {
            return std::nullopt;
        }
        auto event = std::move(queue_.front());
        queue_.pop_front();
        return event;
    }

    void ProgressChannel::close()
    {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            closed_ = true;
        }
        cv_.notify_all();
    }

    bool ProgressChannel::closed() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return closed_;
    }

    std::size_t ProgressChannel::dropped() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return dropped_;
    }

    ProgressEmitter::ProgressEmitter(ProgressChannel *channel, std::chrono::milliseconds chunk_interval,
                                     SteadyClock clock)
        : channel_(channel), throttle_(chunk_interval, std::move(clock)) {}

    void ProgressEmitter::emit(ProgressEvent::Payload payload)
    {
        ProgressEvent event{.payload = std::move(payload), .droppable = false};
        if (const auto *chunk = std::get_if<events::ChunkCompleted>(&event.payload))
        {
            if (!throttle_.admit(*chunk))
            {
                return;
            }
            event.droppable = chunk->current_chunk > 1 && chunk->current_chunk < chunk->total_chunks;
            ++chunk_events_emitted_;
        }
        if (channel_)
        {
            channel_->push(std::move(event));
        }
    }

    void ProgressEmitter::reset()
    {
        throttle_.reset();
        chunk_events_emitted_ = 0;
    }

    void ProgressEmitter::close()
    {
        if (channel_)
        {
            channel_->close();
        }
    }

} // namespace vidyeet::upload
