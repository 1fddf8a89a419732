#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>

namespace upq {

enum class CancelReason {
    None,
    Cancelled,   // explicit cancel or removal
    Paused,      // pause while uploading
    TimedOut,    // no progress within the transfer timeout
    Shutdown     // scheduler is being destroyed
};

inline const char* to_string(CancelReason reason) {
    switch (reason) {
        case CancelReason::None: return "none";
        case CancelReason::Cancelled: return "cancelled";
        case CancelReason::Paused: return "paused";
        case CancelReason::TimedOut: return "timed-out";
        case CancelReason::Shutdown: return "shutdown";
    }
    return "unknown";
}

/**
 * @brief Cooperative abort signal handed to every in-flight transfer
 *
 * Copies share state: the scheduler keeps one copy, the strategy executor and
 * the transport receive others. Cancelling is sticky and only the first reason
 * is kept.
 *
 * THREAD SAFETY: all members may be called concurrently.
 */
class CancellationToken {
public:
    CancellationToken() : state_(std::make_shared<State>()) {}

    void cancel(CancelReason reason = CancelReason::Cancelled) {
        {
            std::lock_guard lock(state_->mutex);
            if (state_->cancelled.load()) {
                return;
            }
            state_->reason = reason;
            state_->cancelled.store(true);
        }
        state_->cv.notify_all();
    }

    bool is_cancelled() const noexcept {
        return state_->cancelled.load();
    }

    CancelReason reason() const {
        std::lock_guard lock(state_->mutex);
        return state_->reason;
    }

    /**
     * @brief Sleep for up to `timeout`, waking early on cancellation
     *
     * RETURNS: true if the token was cancelled before the timeout elapsed
     */
    template<typename Rep, typename Period>
    bool wait_for(const std::chrono::duration<Rep, Period>& timeout) const {
        std::unique_lock lock(state_->mutex);
        return state_->cv.wait_for(lock, timeout, [this]() {
            return state_->cancelled.load();
        });
    }

private:
    struct State {
        mutable std::mutex mutex;
        std::condition_variable cv;
        std::atomic<bool> cancelled{false};
        CancelReason reason = CancelReason::None;
    };

    std::shared_ptr<State> state_;
};

} // namespace upq
