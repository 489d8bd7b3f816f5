/**
 * @file agent/executor/TaskExecutor.hpp
 * @brief Drives a single task from submitted to a terminal state.
 */
#pragma once

#include "EventChannel.hpp"
#include "agent/task/TaskStore.hpp"
#include "message/A2aTypes.hpp"

#include <nlohmann/json.hpp>

#include <memory>
#include <string>

class Logger;

namespace EchoAgent::Capabilities {
class CapabilityRegistry;
}

namespace EchoAgent::Executor {

/// Everything the executor needs to run one task.
struct RequestContext {
    std::string task_id;
    Protocol::Message message;
    std::string capability;                                    ///< Capability name to invoke
    nlohmann::json parameters = nlohmann::json::object();      ///< Capability parameters
};

/// Artifact name and description attached to every successful response.
inline constexpr const char* ResponseArtifactName = "echo_response";
inline constexpr const char* ResponseArtifactDescription = "Echo response";

/**
 * @brief Runs the task lifecycle and publishes its events.
 *
 * For each task, exactly one of these sequences is published:
 * - StatusUpdate(working), ArtifactUpdate(response), StatusUpdate(completed, final)
 * - StatusUpdate(working), StatusUpdate(failed, final)
 *
 * Every event is first applied to the TaskStore (which enforces the state
 * machine) and then published on the channel, so the store never lags
 * behind what a consumer has seen. Capability failures end in a failed
 * status and never propagate out of execute().
 */
class TaskExecutor {
public:
    TaskExecutor(const Capabilities::CapabilityRegistry& registry,
                 Tasks::TaskStore& store,
                 std::shared_ptr<Logger> logger = nullptr);

    /**
     * @brief Execute one submitted task to completion.
     *
     * @param context Task id, input message, capability name and parameters.
     * @param channel Channel for this task's events.
     * @throws TaskNotFoundError if the task was never created.
     * @throws AlreadyTerminalError if the task already finished or was canceled.
     * @throws TaskConflictError if another driver already moved the task to working.
     * @throws std::invalid_argument if the channel belongs to another task.
     * Nothing is published when one of these is thrown.
     */
    void execute(const RequestContext& context, EventChannel& channel);

    /**
     * @brief Cancel a task that has not started.
     *
     * In-flight capability calls are never interrupted, so a working task
     * yields CancelOutcome::NotCancelable.
     */
    Tasks::CancelOutcome cancel(const std::string& task_id);

private:
    void emit(Protocol::Event event, EventChannel& channel);
    void fail(const std::string& task_id, const std::string& context_id,
              const std::string& error_type, const std::string& detail,
              EventChannel& channel);

    const Capabilities::CapabilityRegistry& registry_;
    Tasks::TaskStore& store_;
    std::shared_ptr<Logger> logger_;
};

} // namespace EchoAgent::Executor
