/**
 * @file agent/executor/TaskExecutor.cpp
 * @brief Implementation of the task lifecycle driver.
 */
#include "TaskExecutor.hpp"
#include "capabilities/registry/CapabilityRegistry.hpp"
#include "message/AgentErrors.hpp"
#include "IdGenerator.hpp"
#include "logger.hpp"

#include <stdexcept>

namespace EchoAgent::Executor {

using Protocol::TaskState;

TaskExecutor::TaskExecutor(const Capabilities::CapabilityRegistry& registry,
                           Tasks::TaskStore& store,
                           std::shared_ptr<Logger> logger)
    : registry_(registry)
    , store_(store)
    , logger_(std::move(logger))
{
}

void TaskExecutor::execute(const RequestContext& context, EventChannel& channel) {
    if (channel.task_id() != context.task_id) {
        throw std::invalid_argument("TaskExecutor: channel " + channel.task_id() +
                                    " does not belong to task " + context.task_id);
    }

    const std::string context_id = store_.get(context.task_id).context_id;

    // Claiming the task: the store rejects this unless the task is submitted
    Protocol::StatusUpdate working;
    working.task_id = context.task_id;
    working.context_id = context_id;
    working.state = TaskState::Working;
    working.is_final = false;
    emit(working, channel);

    const std::string text = Protocol::concatenate_text(context.message.parts);

    std::string response;
    try {
        response = registry_.invoke(context.capability, context.task_id, text, context.parameters);
    } catch (const UnknownCapability& e) {
        fail(context.task_id, context_id, "UnknownCapability", e.what(), channel);
        return;
    } catch (const CapabilityError& e) {
        fail(context.task_id, context_id, "CapabilityError", e.what(), channel);
        return;
    }

    Protocol::ArtifactUpdate artifact;
    artifact.task_id = context.task_id;
    artifact.context_id = context_id;
    artifact.artifact.artifact_id = IdGenerator::uuid4();
    artifact.artifact.name = ResponseArtifactName;
    artifact.artifact.description = ResponseArtifactDescription;
    artifact.artifact.parts.push_back(Protocol::TextPart{response});
    artifact.artifact.is_final_chunk = true;
    artifact.is_last_chunk = true;
    emit(std::move(artifact), channel);

    Protocol::StatusUpdate completed;
    completed.task_id = context.task_id;
    completed.context_id = context_id;
    completed.state = TaskState::Completed;
    completed.is_final = true;
    emit(completed, channel);

    if (logger_) {
        logger_->debug("TaskExecutor: task " + context.task_id + " completed with capability " +
                       context.capability);
    }
}

Tasks::CancelOutcome TaskExecutor::cancel(const std::string& task_id) {
    auto outcome = store_.cancel(task_id);
    if (logger_) {
        logger_->info("TaskExecutor: cancel task " + task_id + ": " + Tasks::to_string(outcome));
    }
    return outcome;
}

void TaskExecutor::emit(Protocol::Event event, EventChannel& channel) {
    store_.append_event(event);
    if (!channel.publish(std::move(event)) && logger_) {
        logger_->warning("TaskExecutor: channel for task " + channel.task_id() +
                         " closed by consumer, event dropped");
    }
}

void TaskExecutor::fail(const std::string& task_id, const std::string& context_id,
                        const std::string& error_type, const std::string& detail,
                        EventChannel& channel) {
    if (logger_) {
        logger_->warning("TaskExecutor: task " + task_id + " failed (" + error_type + "): " + detail);
    }

    Protocol::StatusUpdate failed;
    failed.task_id = task_id;
    failed.context_id = context_id;
    failed.state = TaskState::Failed;
    failed.is_final = true;
    failed.metadata = {{"error", detail}, {"errorType", error_type}};
    emit(failed, channel);
}

} // namespace EchoAgent::Executor
