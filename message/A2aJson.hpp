/**
 * @file message/A2aJson.hpp
 * @brief JSON wire conversion for the A2A protocol model (camelCase field names).
 */
#pragma once

#include "A2aTypes.hpp"

#include <nlohmann/json.hpp>
#include <string>

namespace EchoAgent::Protocol {

/// ISO 8601 UTC with millisecond precision, e.g. "2026-10-19T08:15:30.250Z".
[[nodiscard]] std::string format_timestamp(Timestamp ts);

[[nodiscard]] nlohmann::json part_to_json(const Part& part);
[[nodiscard]] nlohmann::json message_to_json(const Message& message);
[[nodiscard]] nlohmann::json artifact_to_json(const Artifact& artifact);
[[nodiscard]] nlohmann::json status_to_json(const TaskStatus& status);
[[nodiscard]] nlohmann::json task_to_json(const Task& task);
[[nodiscard]] nlohmann::json event_to_json(const Event& event);

/**
 * @brief Decode one part object.
 * @throws ProtocolError on a missing/unknown "kind" or a wrongly typed field.
 */
[[nodiscard]] Part part_from_json(const nlohmann::json& j);

/**
 * @brief Decode a message object.
 *
 * "parts" must be an array (it may be empty). "role" defaults to user and
 * "messageId" is generated when absent.
 * @throws ProtocolError if the object is malformed.
 */
[[nodiscard]] Message message_from_json(const nlohmann::json& j);

} // namespace EchoAgent::Protocol
