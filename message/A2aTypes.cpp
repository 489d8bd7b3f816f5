/**
 * @file message/A2aTypes.cpp
 * @brief Enum names and small helpers for the A2A protocol model.
 */
#include "A2aTypes.hpp"

namespace EchoAgent::Protocol {

const char* to_string(TaskState state) noexcept {
    switch (state) {
        case TaskState::Submitted: return "submitted";
        case TaskState::Working:   return "working";
        case TaskState::Completed: return "completed";
        case TaskState::Failed:    return "failed";
        case TaskState::Canceled:  return "canceled";
    }
    return "unknown";
}

std::optional<TaskState> task_state_from_string(const std::string& name) {
    if (name == "submitted") return TaskState::Submitted;
    if (name == "working") return TaskState::Working;
    if (name == "completed") return TaskState::Completed;
    if (name == "failed") return TaskState::Failed;
    if (name == "canceled") return TaskState::Canceled;
    return std::nullopt;
}

const char* to_string(Role role) noexcept {
    return role == Role::Agent ? "agent" : "user";
}

std::string concatenate_text(const std::vector<Part>& parts) {
    std::string out;
    for (const auto& part : parts) {
        if (const auto* text = std::get_if<TextPart>(&part)) {
            out += text->text;
        }
    }
    return out;
}

const std::string& event_task_id(const Event& event) noexcept {
    return std::visit([](const auto& e) -> const std::string& { return e.task_id; }, event);
}

bool is_final_event(const Event& event) noexcept {
    const auto* status = std::get_if<StatusUpdate>(&event);
    return status != nullptr && status->is_final;
}

} // namespace EchoAgent::Protocol
