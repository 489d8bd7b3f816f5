/**
 * @file agent/task/TaskStore.cpp
 * @brief Implementation of the in-memory task store.
 */
#include "TaskStore.hpp"
#include "message/AgentErrors.hpp"
#include "logger.hpp"

#include <chrono>
#include <stdexcept>
#include <variant>

namespace EchoAgent::Tasks {

using Protocol::TaskState;

const char* to_string(CancelOutcome outcome) noexcept {
    switch (outcome) {
        case CancelOutcome::Canceled:      return "canceled";
        case CancelOutcome::NotCancelable: return "not_cancelable";
        case CancelOutcome::NotFound:      return "not_found";
    }
    return "unknown";
}

namespace {

Protocol::TaskStatus status_now(TaskState state) {
    return Protocol::TaskStatus{state, std::chrono::system_clock::now()};
}

void set_status(Protocol::Task& task, TaskState state) {
    task.status = status_now(state);
    task.status_history.push_back(task.status);
}

} // anonymous namespace

TaskStore::TaskStore(std::shared_ptr<Logger> logger)
    : logger_(std::move(logger))
{
}

Protocol::Task TaskStore::create(const std::string& task_id, const std::string& context_id) {
    if (task_id.empty()) {
        throw std::invalid_argument("TaskStore: task id cannot be empty");
    }

    Protocol::Task task;
    task.task_id = task_id;
    task.context_id = context_id.empty() ? task_id : context_id;
    set_status(task, TaskState::Submitted);

    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto [it, inserted] = tasks_.emplace(task_id, task);
        if (!inserted) {
            throw TaskConflictError("Task " + task_id + " already exists");
        }
    }

    if (logger_) {
        logger_->debug("TaskStore: created task " + task_id + " context " + task.context_id);
    }
    return task;
}

Protocol::Task TaskStore::get(const std::string& task_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = tasks_.find(task_id);
    if (it == tasks_.end()) {
        throw TaskNotFoundError(task_id);
    }
    return it->second;
}

std::optional<Protocol::Task> TaskStore::find(const std::string& task_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = tasks_.find(task_id);
    if (it == tasks_.end()) {
        return std::nullopt;
    }
    return it->second;
}

void TaskStore::append_event(const Protocol::Event& event) {
    const auto& task_id = Protocol::event_task_id(event);

    std::lock_guard<std::mutex> lock(mutex_);
    auto it = tasks_.find(task_id);
    if (it == tasks_.end()) {
        throw TaskNotFoundError(task_id);
    }
    Protocol::Task& task = it->second;

    if (Protocol::is_terminal(task.status.state)) {
        throw AlreadyTerminalError(task_id);
    }

    if (const auto* status = std::get_if<Protocol::StatusUpdate>(&event)) {
        apply_status(task, *status);
    } else {
        apply_artifact(task, std::get<Protocol::ArtifactUpdate>(event));
    }
}

void TaskStore::apply_status(Protocol::Task& task, const Protocol::StatusUpdate& update) {
    if (update.context_id != task.context_id) {
        throw std::invalid_argument("TaskStore: context id " + update.context_id +
                                    " does not match task " + task.task_id);
    }
    if (update.is_final != Protocol::is_terminal(update.state)) {
        throw std::invalid_argument(std::string("TaskStore: is_final mismatch for state ") +
                                    Protocol::to_string(update.state));
    }

    const TaskState from = task.status.state;
    bool legal = false;
    switch (update.state) {
        case TaskState::Working:
        case TaskState::Canceled:
            legal = from == TaskState::Submitted;
            break;
        case TaskState::Completed:
        case TaskState::Failed:
            legal = from == TaskState::Working;
            break;
        case TaskState::Submitted:
            legal = false;
            break;
    }
    if (!legal) {
        throw TaskConflictError(std::string("Task ") + task.task_id + ": illegal transition " +
                                Protocol::to_string(from) + " -> " +
                                Protocol::to_string(update.state));
    }

    set_status(task, update.state);
    if (update.metadata.is_object()) {
        for (auto it = update.metadata.begin(); it != update.metadata.end(); ++it) {
            task.metadata[it.key()] = it.value();
        }
    }

    if (logger_) {
        logger_->debug("TaskStore: task " + task.task_id + " " + Protocol::to_string(from) +
                       " -> " + Protocol::to_string(update.state));
    }
}

void TaskStore::apply_artifact(Protocol::Task& task, const Protocol::ArtifactUpdate& update) {
    if (update.context_id != task.context_id) {
        throw std::invalid_argument("TaskStore: context id " + update.context_id +
                                    " does not match task " + task.task_id);
    }
    if (task.status.state != TaskState::Working) {
        throw TaskConflictError("Task " + task.task_id + ": artifact outside working state");
    }
    task.artifacts.push_back(update.artifact);
}

CancelOutcome TaskStore::cancel(const std::string& task_id) {
    CancelOutcome outcome = CancelOutcome::NotCancelable;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = tasks_.find(task_id);
        if (it == tasks_.end()) {
            outcome = CancelOutcome::NotFound;
        } else if (it->second.status.state == TaskState::Submitted) {
            set_status(it->second, TaskState::Canceled);
            outcome = CancelOutcome::Canceled;
        }
    }

    if (logger_) {
        logger_->debug("TaskStore: cancel " + task_id + ": " + to_string(outcome));
    }
    return outcome;
}

size_t TaskStore::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tasks_.size();
}

} // namespace EchoAgent::Tasks
