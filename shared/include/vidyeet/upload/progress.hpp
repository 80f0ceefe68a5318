/**
 * vidyeet - Upload progress events and the bounded channel that carries them to a consumer.
 *
 * The producer never blocks: when the channel is full the oldest intermediate chunk event is
 * discarded. Phase transitions and the first/last chunk events are always delivered.
 */
#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

#include <nlohmann/json.hpp>

#include "vidyeet/error_codes.hpp"

namespace vidyeet::upload
{

    enum class Phase : std::uint8_t
    {
        ValidatingFile,
        FileValidated,
        CreatingTarget,
        TargetCreated,
        UploadStarted,
        ChunkCompleted,
        UploadFinished,
        AwaitingAsset,
        Completed,
        Failed
    };

    std::string_view to_string(Phase phase) noexcept;

    namespace events
    {
        struct ValidatingFile
        {
            std::string file_path;
        };

        struct FileValidated
        {
            std::string file_name;
            std::uint64_t size_bytes{};
            std::string format;
        };

        struct CreatingTarget
        {
            std::string file_name;
        };

        struct TargetCreated
        {
            std::string upload_id;
        };

        struct UploadStarted
        {
            std::string file_name;
            std::uint64_t size_bytes{};
            std::uint32_t total_chunks{};
        };

        // current_chunk is 1-based.
        struct ChunkCompleted
        {
            std::uint32_t current_chunk{};
            std::uint32_t total_chunks{};
            std::uint64_t bytes_sent{};
            std::uint64_t total_bytes{};
        };

        struct UploadFinished
        {
            std::string file_name;
            std::uint64_t size_bytes{};
        };

        struct AwaitingAsset
        {
            std::string upload_id;
            std::uint64_t elapsed_secs{};
        };

        struct Completed
        {
            std::string asset_id;
        };

        struct Failed
        {
            ErrorCategory category{ErrorCategory::Internal};
            ErrorCode code{ErrorCode::InternalError};
            std::string step;
            std::string message;
        };
    } // namespace events

    struct ProgressEvent
    {
        using Payload = std::variant<events::ValidatingFile, events::FileValidated, events::CreatingTarget,
                                     events::TargetCreated, events::UploadStarted, events::ChunkCompleted,
                                     events::UploadFinished, events::AwaitingAsset, events::Completed,
                                     events::Failed>;

        Payload payload;
        // Set by the emitter on intermediate chunk events the channel may discard under pressure.
        bool droppable{false};

        Phase phase() const noexcept;
    };

    void to_json(nlohmann::json &json, const ProgressEvent &event);

    using SteadyClock = std::function<std::chrono::steady_clock::time_point()>;

    class ProgressThrottle
    {
    public:
        explicit ProgressThrottle(std::chrono::milliseconds min_interval, SteadyClock clock = {});

        // First and last chunks always pass; others pass once min_interval has elapsed since the last one that did.
        bool admit(const events::ChunkCompleted &chunk);

        void reset();

    private:
        std::chrono::steady_clock::time_point now() const;

        std::chrono::milliseconds min_interval_;
        SteadyClock clock_;
        std::optional<std::chrono::steady_clock::time_point> last_emitted_;
    };

    // Bounded queue between the upload thread and the presentation consumer. When full, the oldest
    // droppable event is discarded (or the incoming one, if it is droppable). Non-droppable events
    // are always kept, so a stalled consumer lets the queue grow past capacity by one entry per
    // such event, e.g. one AwaitingAsset per poll.
    class ProgressChannel
    {
    public:
        explicit ProgressChannel(std::size_t capacity = 64);

        ProgressChannel(const ProgressChannel &) = delete;
        ProgressChannel &operator=(const ProgressChannel &) = delete;

        // Never blocks. Events pushed after close() are ignored.
        void push(ProgressEvent event);

        // Blocks until an event is available; nullopt once closed and drained.
        std::optional<ProgressEvent> pop();

        std::optional<ProgressEvent> try_pop();

        void close();

        bool closed() const;
        std::size_t dropped() const;

    private:
        std::size_t capacity_;
        mutable std::mutex mutex_;
        std::condition_variable cv_;
        std::deque<ProgressEvent> queue_;
        std::size_t dropped_{0};
        bool closed_{false};
    };

    class ProgressEmitter
    {
    public:
        // A null channel turns the emitter into a sink that discards everything.
        ProgressEmitter(ProgressChannel *channel, std::chrono::milliseconds chunk_interval, SteadyClock clock = {});

        void emit(ProgressEvent::Payload payload);

        // Start of a new run; forgets the throttle state.
        void reset();

        void close();

        std::uint64_t chunk_events_emitted() const noexcept { return chunk_events_emitted_; }

    private:
        ProgressChannel *channel_;
        ProgressThrottle throttle_;
        std::uint64_t chunk_events_emitted_{0};
    };

} // namespace vidyeet::upload
