#ifndef THREAD_SAFE_QUEUE_HPP
#define THREAD_SAFE_QUEUE_HPP

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <utility>

/**
 * @brief A bounded, thread-safe FIFO queue.
 *
 * Producers block in push() while the queue is full; consumers block in pop()
 * while it is empty. After shutdown() no further elements are accepted, but
 * elements already queued can still be popped.
 *
 * @tparam T The type of elements stored in the queue.
 */
template <typename T>
class ThreadSafeQueue {
public:
    /**
     * @param capacity Maximum number of queued elements (0 is treated as 1).
     */
    explicit ThreadSafeQueue(std::size_t capacity = 64)
        : capacity_(capacity == 0 ? 1 : capacity), shutdown_(false) {}

    /**
     * @brief Adds an element to the back of the queue.
     *
     * Blocks while the queue is full. Notifies one waiting consumer.
     *
     * @param value The element to add to the queue.
     * @return false if the queue was shut down before the element could be added.
     */
    bool push(T value) {
        std::unique_lock<std::mutex> lock(mutex_);
        not_full_.wait(lock, [this]() { return shutdown_ || queue_.size() < capacity_; });
        if (shutdown_) {
            return false;
        }
        queue_.push_back(std::move(value));
        not_empty_.notify_one();
        return true;
    }

    /**
     * @brief Adds an element without blocking.
     * @return false if the queue is full or shut down.
     */
    bool try_push(T value) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (shutdown_ || queue_.size() >= capacity_) {
            return false;
        }
        queue_.push_back(std::move(value));
        not_empty_.notify_one();
        return true;
    }

    /**
     * @brief Removes and returns the front element of the queue.
     *
     * Blocks while the queue is empty and not shut down.
     *
     * @return The front element, or std::nullopt once the queue is shut down and empty.
     */
    std::optional<T> pop() {
        std::unique_lock<std::mutex> lock(mutex_);
        not_empty_.wait(lock, [this]() { return shutdown_ || !queue_.empty(); });
        if (queue_.empty()) {
            return std::nullopt;
        }
        T value = std::move(queue_.front());
        queue_.pop_front();
        not_full_.notify_one();
        return value;
    }

    /**
     * @brief Removes and returns the front element without blocking.
     */
    std::optional<T> try_pop() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (queue_.empty()) {
            return std::nullopt;
        }
        T value = std::move(queue_.front());
        queue_.pop_front();
        not_full_.notify_one();
        return value;
    }

    bool empty() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return queue_.empty();
    }

    std::size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return queue_.size();
    }

    std::size_t capacity() const noexcept { return capacity_; }

    bool is_shutdown() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return shutdown_;
    }

    /**
     * @brief Stops accepting elements and wakes every waiting thread.
     */
    void shutdown() {
        std::lock_guard<std::mutex> lock(mutex_);
        shutdown_ = true;
        not_empty_.notify_all();
        not_full_.notify_all();
    }

private:
    mutable std::mutex mutex_;
    std::deque<T> queue_;
    std::condition_variable not_empty_;
    std::condition_variable not_full_;
    const std::size_t capacity_;
    bool shutdown_;
};

#endif // THREAD_SAFE_QUEUE_HPP
