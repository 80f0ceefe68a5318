/**
 * vidyeet - Sends chunk ranges to the signed upload URL with retry and backoff.
 */
#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <optional>
#include <string>
#include <vector>

#include "vidyeet/http.hpp"
#include "vidyeet/settings.hpp"
#include "vidyeet/upload/chunk_planner.hpp"

namespace vidyeet
{
    class CancellationToken;
}

namespace vidyeet::upload
{

    class ProgressEmitter;

    struct UploadSession
    {
        std::string upload_id;
        std::string url;
        std::uint32_t timeout_seconds{};
    };

    // Resumption checkpoint. Advanced only after a chunk has been acknowledged.
    struct TransferState
    {
        std::uint64_t bytes_acknowledged{0};
        std::optional<std::uint32_t> last_completed_index;

        std::uint32_t next_index() const noexcept
        {
            return last_completed_index ? *last_completed_index + 1 : 0;
        }

        void acknowledge(const ChunkRange &range);
    };

    // Reads byte ranges of one file. Holds the stream open for the lifetime of the transfer.
    class ChunkSource
    {
    public:
        explicit ChunkSource(const std::filesystem::path &path);

        ChunkSource(const ChunkSource &) = delete;
        ChunkSource &operator=(const ChunkSource &) = delete;

        std::string read(const ChunkRange &range);

    private:
        std::filesystem::path path_;
        std::ifstream in_;
    };

    std::chrono::milliseconds backoff_delay(const RetryPolicy &policy, std::uint32_t failed_attempts);

    class TransferExecutor
    {
    public:
        TransferExecutor(http::Transport &transport, RetryPolicy policy, const CancellationToken *cancel,
                         ProgressEmitter *emitter);

        // PUTs one range, retrying transient failures. On success advances `state` and reports the chunk.
        void send(const ChunkRange &range, std::uint32_t total_chunks, const UploadSession &session,
                  ChunkSource &source, const std::string &content_type, TransferState &state);

        std::uint32_t attempts_for_last_chunk() const noexcept { return last_attempts_; }
        std::uint64_t total_requests() const noexcept { return total_requests_; }

    private:
        http::Request build_request(const ChunkRange &range, const UploadSession &session, std::string payload,
                                    const std::string &content_type) const;
        void wait_before_retry(std::uint32_t failed_attempts, std::uint32_t chunk_number);

        http::Transport &transport_;
        RetryPolicy policy_;
        const CancellationToken *cancel_;
        ProgressEmitter *emitter_;
        std::uint32_t last_attempts_{0};
        std::uint64_t total_requests_{0};
    };

} // namespace vidyeet::upload
