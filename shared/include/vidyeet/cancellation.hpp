/**
 * vidyeet - Cooperative cancellation shared by the transfer, poll and HTTP layers.
 */
#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <string_view>

namespace vidyeet
{

    class CancellationToken
    {
    public:
        CancellationToken() = default;

        CancellationToken(const CancellationToken &) = delete;
        CancellationToken &operator=(const CancellationToken &) = delete;

        void request_cancel();

        bool cancelled() const noexcept
        {
            return cancelled_.load(std::memory_order_acquire);
        }

        // Sleeps for up to `duration`; returns true if cancellation arrived first.
        bool wait_for(std::chrono::milliseconds duration) const;

        // Throws Error(Cancelled) naming `where` when cancellation has been requested.
        void throw_if_cancelled(std::string_view where) const;

    private:
        std::atomic<bool> cancelled_{false};
        mutable std::mutex mutex_;
        mutable std::condition_variable cv_;
    };

} // namespace vidyeet
