#ifndef AGENTFLOW_CORE_TYPES_CANCELLATION_H
#define AGENTFLOW_CORE_TYPES_CANCELLATION_H

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <optional>

namespace agentflow {

// Cooperative cancel signal shared by the engine loop, parallel workers and barrier polls.
class CancellationToken {
public:
    using Clock = std::chrono::steady_clock;

    void cancel() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            cancelled_ = true;
        }
        cv_.notify_all();
    }

    // A passed deadline reads as cancelled; std::nullopt removes it
    void set_deadline(std::optional<Clock::time_point> deadline) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            deadline_ = deadline;
        }
        cv_.notify_all();
    }

    // True only for an explicit cancel(), not for a passed deadline
    bool cancel_requested() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return cancelled_;
    }

    bool is_cancelled() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return cancelled_ || (deadline_ && Clock::now() >= *deadline_);
    }

    // Sleeps up to `duration`; returns false if cancelled before or during the wait
    template <typename Rep, typename Period>
    bool wait_for(std::chrono::duration<Rep, Period> duration) const {
        std::unique_lock<std::mutex> lock(mutex_);
        auto until = Clock::now() + std::chrono::duration_cast<Clock::duration>(duration);
        if (deadline_ && *deadline_ < until) {
            until = *deadline_;
        }
        cv_.wait_until(lock, until, [this] { return cancelled_; });
        return !(cancelled_ || (deadline_ && Clock::now() >= *deadline_));
    }

private:
    mutable std::mutex mutex_;
    mutable std::condition_variable cv_;
    bool cancelled_ = false;
    std::optional<Clock::time_point> deadline_;
};

} // namespace agentflow

#endif // AGENTFLOW_CORE_TYPES_CANCELLATION_H
