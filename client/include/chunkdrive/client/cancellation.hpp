#pragma once

#include <chrono>
#include <condition_variable>
#include <mutex>

namespace chunkdrive::client
{

    // One-way latch shared by a coordinator and its workers.
    class CancellationToken
    {
    public:
        void cancel()
        {
            {
                std::lock_guard lock(mutex_);
                cancelled_ = true;
            }
            condition_.notify_all();
        }

        bool is_cancelled() const
        {
            std::lock_guard lock(mutex_);
            return cancelled_;
        }

        // Sleeps for `duration` unless cancelled first; returns true when cancelled.
        template <typename Rep, typename Period>
        bool wait_for(const std::chrono::duration<Rep, Period> &duration) const
        {
            std::unique_lock lock(mutex_);
            return condition_.wait_for(lock, duration, [this]
                                       { return cancelled_; });
        }

    private:
        mutable std::mutex mutex_;
        mutable std::condition_variable condition_;
        bool cancelled_{false};
    };

} // namespace chunkdrive::client
