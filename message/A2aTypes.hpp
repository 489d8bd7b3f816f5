/**
 * @file message/A2aTypes.hpp
 * @brief In-memory A2A protocol model: messages, artifacts, tasks and events.
 *
 * These types are transport-agnostic; JSON wire conversion lives in A2aJson.hpp.
 */
#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include <nlohmann/json.hpp>

namespace EchoAgent::Protocol {

/**
 * @brief Task lifecycle states.
 *
 * Submitted -> Working -> {Completed | Failed}. Canceled is reachable only
 * from Submitted. Completed, Failed and Canceled are terminal.
 */
enum class TaskState { Submitted, Working, Completed, Failed, Canceled };

[[nodiscard]] const char* to_string(TaskState state) noexcept;
[[nodiscard]] std::optional<TaskState> task_state_from_string(const std::string& name);
[[nodiscard]] constexpr bool is_terminal(TaskState state) noexcept {
    return state == TaskState::Completed || state == TaskState::Failed || state == TaskState::Canceled;
}

enum class Role { User, Agent };

[[nodiscard]] const char* to_string(Role role) noexcept;

/// Plain text content ({"kind":"text"}).
struct TextPart {
    std::string text;
};

/// Structured content ({"kind":"data"}). Carried through but never echoed.
struct DataPart {
    nlohmann::json data;
};

using Part = std::variant<TextPart, DataPart>;

/**
 * @brief Concatenate the text of every TextPart, in order.
 * @return Empty string when there are no text parts.
 */
[[nodiscard]] std::string concatenate_text(const std::vector<Part>& parts);

/// One inbound or outbound conversational message.
struct Message {
    std::string message_id;
    Role role{Role::User};
    std::vector<Part> parts;
    std::optional<std::string> context_id;
    std::optional<std::string> task_id;
    nlohmann::json metadata = nlohmann::json::object();
};

/// One unit of output attached to a task.
struct Artifact {
    std::string artifact_id;
    std::string name;
    std::string description;
    std::vector<Part> parts;
    bool is_final_chunk{true};
};

using Timestamp = std::chrono::system_clock::time_point;

/// A state together with the moment it was entered.
struct TaskStatus {
    TaskState state{TaskState::Submitted};
    Timestamp timestamp{};
};

/**
 * @brief Stored record of one invocation.
 *
 * status_history and artifacts are append-only; status_history.back()
 * always equals status.
 */
struct Task {
    std::string task_id;
    std::string context_id;
    TaskStatus status;
    std::vector<TaskStatus> status_history;
    std::vector<Artifact> artifacts;
    nlohmann::json metadata = nlohmann::json::object();
};

/// Status transition published by the executor.
struct StatusUpdate {
    std::string task_id;
    std::string context_id;
    TaskState state{TaskState::Working};
    bool is_final{false};
    nlohmann::json metadata = nlohmann::json::object();
};

/// Produced artifact published by the executor.
struct ArtifactUpdate {
    std::string task_id;
    std::string context_id;
    Artifact artifact;
    bool is_last_chunk{true};
};

using Event = std::variant<StatusUpdate, ArtifactUpdate>;

[[nodiscard]] const std::string& event_task_id(const Event& event) noexcept;

/// True for a StatusUpdate with is_final set.
[[nodiscard]] bool is_final_event(const Event& event) noexcept;

} // namespace EchoAgent::Protocol
