/**
 * @file message/A2aJson.cpp
 * @brief JSON encoders/decoders for the A2A protocol model.
 */
#include "A2aJson.hpp"
#include "AgentErrors.hpp"
#include "IdGenerator.hpp"

#include <ctime>
#include <iomanip>
#include <sstream>

namespace EchoAgent::Protocol {

using json = nlohmann::json;

std::string format_timestamp(Timestamp ts) {
    const auto since_epoch = ts.time_since_epoch();
    const auto secs = std::chrono::duration_cast<std::chrono::seconds>(since_epoch);
    const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(since_epoch - secs).count();

    std::time_t t = static_cast<std::time_t>(secs.count());
    std::tm tm_buf{};
    gmtime_r(&t, &tm_buf);

    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%Y-%m-%dT%H:%M:%S")
        << '.' << std::setw(3) << std::setfill('0') << millis << 'Z';
    return oss.str();
}

json part_to_json(const Part& part) {
    if (const auto* text = std::get_if<TextPart>(&part)) {
        return json{{"kind", "text"}, {"text", text->text}};
    }
    const auto& data = std::get<DataPart>(part);
    return json{{"kind", "data"}, {"data", data.data}};
}

static json parts_to_json(const std::vector<Part>& parts) {
    json arr = json::array();
    for (const auto& part : parts) {
        arr.push_back(part_to_json(part));
    }
    return arr;
}

json message_to_json(const Message& message) {
    json j{
        {"kind", "message"},
        {"messageId", message.message_id},
        {"role", to_string(message.role)},
        {"parts", parts_to_json(message.parts)}
    };
    if (message.context_id) j["contextId"] = *message.context_id;
    if (message.task_id) j["taskId"] = *message.task_id;
    if (!message.metadata.empty()) j["metadata"] = message.metadata;
    return j;
}

json artifact_to_json(const Artifact& artifact) {
    json j{
        {"artifactId", artifact.artifact_id},
        {"name", artifact.name},
        {"parts", parts_to_json(artifact.parts)},
        {"lastChunk", artifact.is_final_chunk}
    };
    if (!artifact.description.empty()) j["description"] = artifact.description;
    return j;
}

json status_to_json(const TaskStatus& status) {
    return json{
        {"state", to_string(status.state)},
        {"timestamp", format_timestamp(status.timestamp)}
    };
}

json task_to_json(const Task& task) {
    json artifacts = json::array();
    for (const auto& artifact : task.artifacts) {
        artifacts.push_back(artifact_to_json(artifact));
    }
    json j{
        {"id", task.task_id},
        {"contextId", task.context_id},
        {"kind", "task"},
        {"status", status_to_json(task.status)},
        {"artifacts", std::move(artifacts)}
    };
    if (!task.metadata.empty()) j["metadata"] = task.metadata;
    return j;
}

json event_to_json(const Event& event) {
    if (const auto* status = std::get_if<StatusUpdate>(&event)) {
        json j{
            {"kind", "status-update"},
            {"taskId", status->task_id},
            {"contextId", status->context_id},
            {"status", {{"state", to_string(status->state)}}},
            {"final", status->is_final}
        };
        if (!status->metadata.empty()) j["metadata"] = status->metadata;
        return j;
    }
    const auto& update = std::get<ArtifactUpdate>(event);
    return json{
        {"kind", "artifact-update"},
        {"taskId", update.task_id},
        {"contextId", update.context_id},
        {"artifact", artifact_to_json(update.artifact)},
        {"lastChunk", update.is_last_chunk}
    };
}

Part part_from_json(const json& j) {
    if (!j.is_object()) {
        throw ProtocolError("part must be an object");
    }
    auto kind_it = j.find("kind");
    if (kind_it == j.end() || !kind_it->is_string()) {
        throw ProtocolError("part.kind must be a string");
    }
    const auto& kind = kind_it->get_ref<const std::string&>();
    if (kind == "text") {
        auto text_it = j.find("text");
        if (text_it == j.end() || !text_it->is_string()) {
            throw ProtocolError("text part requires a string 'text'");
        }
        return TextPart{text_it->get<std::string>()};
    }
    if (kind == "data") {
        auto data_it = j.find("data");
        if (data_it == j.end() || !data_it->is_object()) {
            throw ProtocolError("data part requires an object 'data'");
        }
        return DataPart{*data_it};
    }
    throw ProtocolError("unsupported part kind: " + kind);
}

static std::optional<std::string> optional_string(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) return std::nullopt;
    if (!it->is_string()) {
        throw ProtocolError(std::string("message.") + key + " must be a string");
    }
    return it->get<std::string>();
}

Message message_from_json(const json& j) {
    if (!j.is_object()) {
        throw ProtocolError("message must be an object");
    }

    Message message;
    message.message_id = optional_string(j, "messageId").value_or(IdGenerator::uuid4());

    if (auto role = optional_string(j, "role")) {
        if (*role == "user") {
            message.role = Role::User;
        } else if (*role == "agent") {
            message.role = Role::Agent;
        } else {
            throw ProtocolError("message.role must be 'user' or 'agent'");
        }
    }

    auto parts_it = j.find("parts");
    if (parts_it == j.end() || !parts_it->is_array()) {
        throw ProtocolError("message.parts must be an array");
    }
    message.parts.reserve(parts_it->size());
    for (const auto& part : *parts_it) {
        message.parts.push_back(part_from_json(part));
    }

    message.context_id = optional_string(j, "contextId");
    message.task_id = optional_string(j, "taskId");

    auto meta_it = j.find("metadata");
    if (meta_it != j.end() && !meta_it->is_null()) {
        if (!meta_it->is_object()) {
            throw ProtocolError("message.metadata must be an object");
        }
        message.metadata = *meta_it;
    }
    return message;
}

} // namespace EchoAgent::Protocol
