/**
 * @file event_queue.hpp
 * @brief Blocking multi-producer queue for the scheduler's background threads
 *
 * Wake channel: every queue mutation pushes a wake signal; the admission
 * thread pops one, coalesces whatever else arrived during the debounce
 * window and runs a single admission pass.
 *
 * Event channel: lifecycle events are pushed while the item lock is held
 * and a single dispatch thread pops them in order.
 */

#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <optional>
#include <queue>

namespace upq::events {

template<typename T>
class ThreadSafeQueue {
public:
    ThreadSafeQueue() = default;

    ThreadSafeQueue(const ThreadSafeQueue&) = delete;
    ThreadSafeQueue& operator=(const ThreadSafeQueue&) = delete;

    /// Ignored after shutdown().
    void push(T item) {
        {
            std::unique_lock lock(mutex_);
            if (shutdown_) {
                return;
            }
            queue_.push(std::move(item));
        }
        cv_.notify_one();
    }

    std::optional<T> try_pop() {
        std::unique_lock lock(mutex_);
        return take_locked();
    }

    /// Blocks until an item arrives; nullopt once shut down and empty.
    std::optional<T> pop() {
        std::unique_lock lock(mutex_);
        cv_.wait(lock, [this] { return !queue_.empty() || shutdown_; });
        return take_locked();
    }

    /// nullopt on timeout or once shut down and empty.
    template<typename Rep, typename Period>
    std::optional<T> pop_for(const std::chrono::duration<Rep, Period>& timeout) {
        std::unique_lock lock(mutex_);
        cv_.wait_for(lock, timeout, [this] { return !queue_.empty() || shutdown_; });
        return take_locked();
    }

    std::size_t size() const {
        std::unique_lock lock(mutex_);
        return queue_.size();
    }

    bool empty() const {
        std::unique_lock lock(mutex_);
        return queue_.empty();
    }

    void shutdown() {
        {
            std::unique_lock lock(mutex_);
            shutdown_ = true;
        }
        cv_.notify_all();
    }

private:
    std::optional<T> take_locked() {
        if (queue_.empty()) {
            return std::nullopt;
        }
        T item = std::move(queue_.front());
        queue_.pop();
        return item;
    }

    std::queue<T> queue_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    bool shutdown_ = false;
};

} // namespace upq::events
