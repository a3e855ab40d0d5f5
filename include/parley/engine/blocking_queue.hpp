#pragma once

#include <chrono>
#include <condition_variable>
#include <mutex>
#include <optional>
#include <queue>

namespace parley {
namespace engine {

/**
 * @brief Thread-safe FIFO queue with close semantics
 *
 * Used in two places:
 * - the client's request queue (many callers push, the worker pool pops)
 * - the per-call stream channel (a worker pushes partial responses, the
 *   ResponseStream owner pops)
 *
 * Design:
 * - Mutex + condition variable
 * - Blocking pop for consumers, non-blocking push for producers
 * - close() rejects further pushes but lets consumers drain what is queued,
 *   after which pop() returns nullopt
 */
template<typename T>
class BlockingQueue {
public:
    /**
     * @brief Construct queue with optional capacity limit
     *
     * @param max_size Maximum queue size (0 = unlimited)
     */
    explicit BlockingQueue(size_t max_size = 0)
        : max_size_(max_size)
        , closed_(false)
    {}

    /**
     * @brief Push an item (non-blocking)
     *
     * @return true if enqueued, false if the queue is full or closed
     */
    bool push(T item) {
        std::unique_lock<std::mutex> lock(mutex_);

        if (closed_) {
            return false;
        }

        if (max_size_ > 0 && queue_.size() >= max_size_) {
            return false;  // Queue full
        }

        queue_.push(std::move(item));
        cv_.notify_one();
        return true;
    }

    /**
     * @brief Pop an item (blocking)
     *
     * Blocks until an item is available or the queue is closed and drained.
     *
     * @return std::optional<T> Item if available, nullopt once closed and empty
     */
    std::optional<T> pop() {
        std::unique_lock<std::mutex> lock(mutex_);

        cv_.wait(lock, [this] {
            return !queue_.empty() || closed_;
        });

        if (queue_.empty()) {
            return std::nullopt;
        }

        T item = std::move(queue_.front());
        queue_.pop();
        return item;
    }

    /**
     * @brief Pop with timeout
     *
     * @return std::optional<T> Item if available, nullopt on timeout or once closed and empty
     */
    template<typename Rep, typename Period>
    std::optional<T> pop_for(const std::chrono::duration<Rep, Period>& timeout) {
        std::unique_lock<std::mutex> lock(mutex_);

        bool ready = cv_.wait_for(lock, timeout, [this] {
            return !queue_.empty() || closed_;
        });

        if (!ready || queue_.empty()) {
            return std::nullopt;
        }

        T item = std::move(queue_.front());
        queue_.pop();
        return item;
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return queue_.size();
    }

    bool empty() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return queue_.empty();
    }

    /**
     * @brief Close the queue
     *
     * Wakes up blocked pop() calls and rejects new pushes. Items already
     * queued stay available to consumers.
     */
    void close() {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
        cv_.notify_all();
    }

    bool is_closed() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return closed_;
    }

    /**
     * @brief Drop all pending items
     */
    void clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        while (!queue_.empty()) {
            queue_.pop();
        }
    }

private:
    std::queue<T> queue_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    size_t max_size_;
    bool closed_;
};

} // namespace engine
} // namespace parley
