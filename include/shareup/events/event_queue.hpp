/**
 * @file event_queue.hpp
 * @brief Blocking FIFO used to hand callbacks to a notification thread
 *
 * Producers (worker threads running transfers) push without blocking;
 * a single consumer pops in FIFO order. Once closed, push is refused and
 * pop drains what is left before reporting the end of the stream.
 *
 * EXAMPLE:
 * ThreadSafeQueue<std::function<void()>> queue;
 * queue.push([] { ... });       // worker
 * while (auto fn = queue.pop()) // notification thread
 *     (*fn)();
 */

#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>

namespace shareup::events {

template<typename T>
class ThreadSafeQueue {
public:
    ThreadSafeQueue() = default;

    ThreadSafeQueue(const ThreadSafeQueue&) = delete;
    ThreadSafeQueue& operator=(const ThreadSafeQueue&) = delete;

    /**
     * @brief Append an item
     *
     * RETURNS: false if the queue was closed and the item was dropped
     * BLOCKS: No
     */
    bool push(T item) {
        {
            std::lock_guard lock(mutex_);
            if (closed_) {
                return false;
            }
            items_.push_back(std::move(item));
        }
        not_empty_.notify_one();
        return true;
    }

    std::optional<T> try_pop() {
        std::lock_guard lock(mutex_);
        return take_front();
    }

    /**
     * @brief Wait for the next item
     *
     * RETURNS: nullopt only when closed and fully drained
     * BLOCKS: Yes
     */
    std::optional<T> pop() {
        std::unique_lock lock(mutex_);
        not_empty_.wait(lock, [this]() { return !items_.empty() || closed_; });
        return take_front();
    }

    template<typename Rep, typename Period>
    std::optional<T> pop_for(const std::chrono::duration<Rep, Period>& timeout) {
        std::unique_lock lock(mutex_);
        not_empty_.wait_for(lock, timeout, [this]() { return !items_.empty() || closed_; });
        return take_front();
    }

    std::size_t size() const {
        std::lock_guard lock(mutex_);
        return items_.size();
    }

    bool empty() const {
        std::lock_guard lock(mutex_);
        return items_.empty();
    }

    bool closed() const {
        std::lock_guard lock(mutex_);
        return closed_;
    }

    /// Refuse further pushes and wake every waiting consumer
    void close() {
        {
            std::lock_guard lock(mutex_);
            closed_ = true;
        }
        not_empty_.notify_all();
    }

private:
    // Caller holds mutex_
    std::optional<T> take_front() {
        if (items_.empty()) {
            return std::nullopt;
        }
        T item = std::move(items_.front());
        items_.pop_front();
        return item;
    }

    std::deque<T> items_;
    mutable std::mutex mutex_;
    std::condition_variable not_empty_;
    bool closed_ = false;
};

} // namespace shareup::events
