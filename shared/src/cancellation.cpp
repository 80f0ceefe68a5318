#include "vidyeet/cancellation.hpp"

#include <string>

#include "vidyeet/error_codes.hpp"

namespace vidyeet
{

    void CancellationToken::request_cancel()
    {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            cancelled_.store(true, std::memory_order_release);
        }
        cv_.notify_all();
    }

    bool CancellationToken::wait_for(std::chrono::milliseconds duration) const
    {
        if (duration.count() <= 0)
        {
            return cancelled();
        }
        std::unique_lock<std::mutex> lock(mutex_);
        return cv_.wait_for(lock, duration, [this]()
                            { return cancelled_.load(std::memory_order_acquire); });
    }

    void CancellationToken::throw_if_cancelled(std::string_view where) const
    {
        if (cancelled())
        {
            throw Error(ErrorCode::Cancelled, "cancelled during " + std::string(where));
        }
    }

} // namespace vidyeet
