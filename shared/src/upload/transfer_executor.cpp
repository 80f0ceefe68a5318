#include "vidyeet/upload/transfer_executor.hpp"

#include <algorithm>
#include <charconv>
#include <cstdint>
#include <optional>
#include <string_view>
#include <thread>

#include <spdlog/spdlog.h>

#include "vidyeet/cancellation.hpp"
#include "vidyeet/crypto.hpp"
#include "vidyeet/error_codes.hpp"
#include "vidyeet/upload/progress.hpp"

namespace vidyeet::upload
{

    namespace
    {

        constexpr int kResumeIncomplete = 308;

        bool is_final_range(const ChunkRange &range) noexcept
        {
            return range.total == 0 || range.end + 1 >= range.total;
        }

        // Last byte the storage endpoint reports as persisted, from a "Range: bytes=0-N" header.
        std::optional<std::uint64_t> persisted_end(const http::Response &response)
        {
            const auto it = response.headers.find("range");
            if (it == response.headers.end())
            {
                return std::nullopt;
            }
            constexpr std::string_view kPrefix = "bytes=0-";
            const std::string_view value = it->second;
            if (value.substr(0, kPrefix.size()) != kPrefix)
            {
                return std::nullopt;
            }
            const auto digits = value.substr(kPrefix.size());
            std::uint64_t end = 0;
            const auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), end);
            if (ec != std::errc() || ptr != digits.data() + digits.size())
            {
                return std::nullopt;
            }
            return end;
        }

        ErrorCode classify_transport_failure(http::TransportError error) noexcept
        {
            switch (error)
            {
            case http::TransportError::Timeout:
                return ErrorCode::RequestTimeout;
            case http::TransportError::Aborted:
                return ErrorCode::Cancelled;
            case http::TransportError::None:
            case http::TransportError::Connection:
            case http::TransportError::Other:
                break;
            }
            return ErrorCode::NetworkFailure;
        }

    } // namespace

    void TransferState::acknowledge(const ChunkRange &range)
    {
        bytes_acknowledged += range.length();
        last_completed_index = range.index;
    }

    ChunkSource::ChunkSource(const std::filesystem::path &path) : path_(path), in_(path, std::ios::binary)
    {
        if (!in_.is_open())
        {
            throw Error(ErrorCode::FileIo, "could not open " + path.string() + " for reading");
        }
    }

    std::string ChunkSource::read(const ChunkRange &range)
    {
        std::string buffer;
        const auto length = range.length();
        if (length == 0)
        {
            return buffer;
        }
        buffer.resize(static_cast<std::size_t>(length));
        in_.clear();
        in_.seekg(static_cast<std::streamoff>(range.start), std::ios::beg);
        in_.read(buffer.data(), static_cast<std::streamsize>(length));
        if (static_cast<std::uint64_t>(in_.gcount()) != length)
        {
            throw Error(ErrorCode::FileIo, "short read from " + path_.string() + " at offset " +
                                               std::to_string(range.start));
        }
        return buffer;
    }

    std::chrono::milliseconds backoff_delay(const RetryPolicy &policy, std::uint32_t failed_attempts)
    {
        const auto base = static_cast<std::uint64_t>(std::max<std::int64_t>(policy.base_delay.count(), 0));
        const auto cap = static_cast<std::uint64_t>(std::max<std::int64_t>(policy.max_delay.count(), 0));
        std::uint64_t delay = base;
        for (std::uint32_t i = 1; i < failed_attempts && delay < cap; ++i)
        {
            delay *= 2;
        }
        delay = std::min(delay, cap);
        if (delay == 0)
        {
            return std::chrono::milliseconds(0);
        }

        // Uniform in [delay/2, delay].
        const auto half = delay / 2;
        const auto spread = static_cast<std::uint32_t>(std::min<std::uint64_t>(delay - half + 1, UINT32_MAX));
        return std::chrono::milliseconds(half + crypto::random_uniform(spread));
    }

    TransferExecutor::TransferExecutor(http::Transport &transport, RetryPolicy policy,
                                       const CancellationToken *cancel, ProgressEmitter *emitter)
        : transport_(transport), policy_(policy), cancel_(cancel), emitter_(emitter)
    {
        if (policy_.max_attempts == 0)
        {
            policy_.max_attempts = 1;
        }
    }

    http::Request TransferExecutor::build_request(const ChunkRange &range, const UploadSession &session,
                                                  std::string payload, const std::string &content_type) const
    {
        http::Request request;
        request.method = http::Method::Put;
        request.url = session.url;
        request.headers["Content-Length"] = std::to_string(range.length());
        request.headers["Content-Range"] = range.content_range();
        request.headers["Content-Type"] = content_type;
        request.body = std::move(payload);
        return request;
    }

    void TransferExecutor::wait_before_retry(std::uint32_t failed_attempts, std::uint32_t chunk_number)
    {
        const auto delay = backoff_delay(policy_, failed_attempts);
        spdlog::debug("Retrying chunk {} in {} ms", chunk_number, delay.count());
        if (cancel_)
        {
            if (cancel_->wait_for(delay))
            {
                throw Error(ErrorCode::Cancelled, "cancelled while waiting to retry chunk " +
                                                      std::to_string(chunk_number));
            }
            return;
        }
        std::this_thread::sleep_for(delay);
    }

    void TransferExecutor::send(const ChunkRange &range, std::uint32_t total_chunks, const UploadSession &session,
                                ChunkSource &source, const std::string &content_type, TransferState &state)
    {
        const auto chunk_number = range.index + 1;
        const auto label = "chunk " + std::to_string(chunk_number) + "/" + std::to_string(total_chunks);
        const auto request = build_request(range, session, source.read(range), content_type);
        const bool final_range = is_final_range(range);

        std::string last_failure;
        last_attempts_ = 0;
        for (std::uint32_t attempt = 1; attempt <= policy_.max_attempts; ++attempt)
        {
            if (cancel_)
            {
                cancel_->throw_if_cancelled(label);
            }
            last_attempts_ = attempt;
            ++total_requests_;

            const auto response = transport_.perform(request, cancel_);
            ErrorCode code = ErrorCode::Ok;
            if (response.error != http::TransportError::None)
            {
                code = classify_transport_failure(response.error);
                last_failure = response.error_message;
            }
            else if (response.status_code == kResumeIncomplete && !final_range &&
                     persisted_end(response) != std::optional<std::uint64_t>(range.end))
            {
                // The endpoint kept less than this chunk; send the whole range again.
                const auto kept = persisted_end(response);
                code = ErrorCode::ServerError;
                last_failure = "HTTP 308, server holds " +
                               (kept ? "bytes 0-" + std::to_string(*kept) : std::string("no bytes")) +
                               " of " + range.content_range();
            }
            else if (response.success() || (response.status_code == kResumeIncomplete && !final_range))
            {
                state.acknowledge(range);
                spdlog::debug("Uploaded {} ({} bytes acknowledged)", label, state.bytes_acknowledged);
                if (emitter_)
                {
                    emitter_->emit(events::ChunkCompleted{
                        .current_chunk = chunk_number,
                        .total_chunks = total_chunks,
                        .bytes_sent = state.bytes_acknowledged,
                        .total_bytes = range.total,
                    });
                }
                return;
            }
            else
            {
                code = classify_http_status(response.status_code);
                last_failure = "HTTP " + std::to_string(response.status_code);
            }

            if (code == ErrorCode::Cancelled)
            {
                throw Error(ErrorCode::Cancelled, label + " aborted");
            }
            if (!is_retryable(code))
            {
                throw Error(code, label + " rejected: " + last_failure);
            }
            spdlog::warn("Attempt {}/{} for {} failed: {}", attempt, policy_.max_attempts, label, last_failure);
            if (attempt < policy_.max_attempts)
            {
                wait_before_retry(attempt, chunk_number);
            }
        }

        throw Error(ErrorCode::RetriesExhausted, label + " failed after " + std::to_string(policy_.max_attempts) +
                                                     " attempts: " + last_failure);
    }

} // namespace vidyeet::upload
