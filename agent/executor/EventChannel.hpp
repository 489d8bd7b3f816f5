/**
 * @file agent/executor/EventChannel.hpp
 * @brief Ordered, bounded delivery of one task's events from executor to handler.
 */
#pragma once

#include "message/A2aTypes.hpp"
#include "message/AgentErrors.hpp"
#include "threadSafeQueue.hpp"

#include <cstddef>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace EchoAgent::Executor {

/**
 * @brief Per-task event channel.
 *
 * Events are delivered in publish order. The final StatusUpdate closes the
 * channel, so it is always the last event a consumer sees. publish() blocks
 * while the channel is full; producer and consumer may live on different
 * threads.
 */
class EventChannel {
public:
    static constexpr std::size_t DefaultCapacity = 16;

    explicit EventChannel(std::string task_id, std::size_t capacity = DefaultCapacity)
        : task_id_(std::move(task_id)), queue_(capacity) {}

    EventChannel(const EventChannel&) = delete;
    EventChannel& operator=(const EventChannel&) = delete;

    [[nodiscard]] const std::string& task_id() const noexcept { return task_id_; }

    /**
     * @brief Publish one event.
     * @return false if the consumer closed the channel; the event was dropped.
     * @throws std::invalid_argument if the event belongs to another task.
     * @throws AlreadyTerminalError if a final event was already published.
     */
    bool publish(Protocol::Event event) {
        if (Protocol::event_task_id(event) != task_id_) {
            throw std::invalid_argument("EventChannel: event for task " +
                                        Protocol::event_task_id(event) +
                                        " published on channel " + task_id_);
        }
        const bool final_event = Protocol::is_final_event(event);
        {
            std::lock_guard<std::mutex> lock(publish_mutex_);
            if (final_published_) {
                throw AlreadyTerminalError(task_id_);
            }
            if (final_event) {
                final_published_ = true;
            }
        }
        const bool delivered = queue_.push(std::move(event));
        if (final_event) {
            queue_.shutdown();
        }
        return delivered;
    }

    /**
     * @brief Next event in order; blocks until one is available.
     * @return std::nullopt once the channel is closed and fully consumed.
     */
    std::optional<Protocol::Event> pop() { return queue_.pop(); }

    /**
     * @brief Consume every remaining event until the channel closes.
     */
    std::vector<Protocol::Event> drain() {
        std::vector<Protocol::Event> events;
        while (auto event = queue_.pop()) {
            events.push_back(std::move(*event));
        }
        return events;
    }

    /// Close from the consumer side; pending publish() calls return false.
    void close() { queue_.shutdown(); }

    [[nodiscard]] bool is_closed() const { return queue_.is_shutdown(); }

    [[nodiscard]] bool final_published() const {
        std::lock_guard<std::mutex> lock(publish_mutex_);
        return final_published_;
    }

private:
    std::string task_id_;
    ThreadSafeQueue<Protocol::Event> queue_;
    mutable std::mutex publish_mutex_;
    bool final_published_{false};
};

} // namespace EchoAgent::Executor
