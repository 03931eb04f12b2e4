/**
 * @file event_queue.hpp
 * @brief Wake-up queue for background workers
 *
 * The SyncScheduler's worker blocks on one of these: sync requests from the
 * UI lane and connectivity changes are pushed, the worker pops with a
 * timeout equal to the periodic sync interval.
 *
 * Requests of the same kind that pile up while the worker is busy collapse
 * into one (push_unique), so ten pull-to-refresh taps during a slow cycle
 * cost one extra cycle, not ten.
 *
 * EXAMPLE:
 * WakeQueue<Trigger> queue;
 * queue.push_unique(Trigger::Manual);  // Producer
 * auto next = queue.pop_for(interval); // Consumer
 */

#pragma once

#include <algorithm>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>

namespace hsync::events {

/**
 * @brief Thread-safe FIFO with optional coalescing
 *
 * THREAD SAFETY:
 * - Any number of producers and consumers
 * - shutdown() wakes every waiting consumer; items still queued are dropped
 */
template<typename T>
class WakeQueue {
public:
    WakeQueue() = default;

    WakeQueue(const WakeQueue&) = delete;
    WakeQueue& operator=(const WakeQueue&) = delete;

    void push(T item) {
        {
            std::lock_guard lock(mutex_);
            if (shutdown_) return;
            items_.push_back(std::move(item));
        }
        cv_.notify_one();
    }

    /// Push unless an equal item is already waiting. Returns true if queued.
    bool push_unique(T item) {
        {
            std::lock_guard lock(mutex_);
            if (shutdown_ || std::find(items_.begin(), items_.end(), item) != items_.end()) {
                return false;
            }
            items_.push_back(std::move(item));
        }
        cv_.notify_one();
        return true;
    }

    /**
     * @brief Wait up to `timeout` for the next item
     *
     * RETURNS: Item, or nullopt on timeout or shutdown
     */
    template<typename Rep, typename Period>
    std::optional<T> pop_for(const std::chrono::duration<Rep, Period>& timeout) {
        std::unique_lock lock(mutex_);
        cv_.wait_for(lock, timeout, [this] { return !items_.empty() || shutdown_; });

        if (shutdown_ || items_.empty()) {
            return std::nullopt;
        }
        T item = std::move(items_.front());
        items_.pop_front();
        return item;
    }

    size_t size() const {
        std::lock_guard lock(mutex_);
        return items_.size();
    }

    void shutdown() {
        {
            std::lock_guard lock(mutex_);
            shutdown_ = true;
            items_.clear();
        }
        cv_.notify_all();
    }

    bool is_shutdown() const {
        std::lock_guard lock(mutex_);
        return shutdown_;
    }

    /// Accept items again after shutdown().
    void reset() {
        std::lock_guard lock(mutex_);
        shutdown_ = false;
    }

private:
    std::deque<T> items_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    bool shutdown_ = false;
};

} // namespace hsync::events
