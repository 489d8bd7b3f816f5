/**
 * @file agent/task/TaskStore.hpp
 * @brief In-memory task records and the task state machine gate.
 */
#pragma once

#include "message/A2aTypes.hpp"

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

class Logger;

namespace EchoAgent::Tasks {

/// Result of a cancel request.
enum class CancelOutcome {
    Canceled,       ///< Task was still submitted and is now canceled
    NotCancelable,  ///< Task is working or already terminal; nothing was changed
    NotFound        ///< No task with that id
};

[[nodiscard]] const char* to_string(CancelOutcome outcome) noexcept;

/**
 * @brief Thread-safe map from task id to Task.
 *
 * Every mutation goes through append_event() or cancel(), which check the
 * transition against the current state under the store mutex:
 *
 *   submitted -> working -> {completed | failed}
 *   submitted -> canceled
 *
 * Records are never removed; they live until the process exits.
 */
class TaskStore {
public:
    explicit TaskStore(std::shared_ptr<Logger> logger = nullptr);

    TaskStore(const TaskStore&) = delete;
    TaskStore& operator=(const TaskStore&) = delete;

    /**
     * @brief Create a submitted task.
     * @param task_id New task id.
     * @param context_id Context id; empty means "use task_id".
     * @return Copy of the new record.
     * @throws TaskConflictError if @p task_id already exists.
     */
    Protocol::Task create(const std::string& task_id, const std::string& context_id = {});

    /**
     * @brief Snapshot of a task.
     * @throws TaskNotFoundError if the id is unknown.
     */
    [[nodiscard]] Protocol::Task get(const std::string& task_id) const;

    /// Snapshot of a task, or std::nullopt if the id is unknown.
    [[nodiscard]] std::optional<Protocol::Task> find(const std::string& task_id) const;

    /**
     * @brief Apply one executor event to its task.
     *
     * @throws TaskNotFoundError for an unknown task.
     * @throws AlreadyTerminalError if the task is completed, failed or canceled.
     * @throws TaskConflictError for a transition not legal from the current state
     *         (a second working, an artifact outside working, ...).
     * @throws std::invalid_argument if the event's context id differs from the task's,
     *         or is_final disagrees with the state.
     */
    void append_event(const Protocol::Event& event);

    /**
     * @brief Cancel a task that has not started.
     */
    CancelOutcome cancel(const std::string& task_id);

    [[nodiscard]] size_t size() const;

private:
    void apply_status(Protocol::Task& task, const Protocol::StatusUpdate& update);
    void apply_artifact(Protocol::Task& task, const Protocol::ArtifactUpdate& update);

    std::shared_ptr<Logger> logger_;
    mutable std::mutex mutex_;
    std::unordered_map<std::string, Protocol::Task> tasks_;
};

} // namespace EchoAgent::Tasks
