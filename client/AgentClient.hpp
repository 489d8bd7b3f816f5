/**
 * @file client/AgentClient.hpp
 * @brief HTTP client for the echo agent: discovery, invocation and health.
 */
#pragma once

#include <nlohmann/json.hpp>

#include <memory>
#include <optional>
#include <string>

class Logger;

namespace EchoAgent::Client {

/// Outcome of a message/send call, extracted from the returned task.
struct InvokeResult {
    std::string task_id;
    std::string context_id;
    std::string state;                                   ///< "completed", "failed", ...
    std::optional<std::string> text;                     ///< First text part of the first artifact
    nlohmann::json metadata = nlohmann::json::object();  ///< Task metadata (failure cause)

    [[nodiscard]] bool completed() const noexcept { return state == "completed"; }
};

enum class HealthStatus {
    Healthy,      ///< /health answered {"status":"healthy"}
    Unhealthy,    ///< Server answered, but not with a healthy status
    Unreachable   ///< No HTTP response at all
};

[[nodiscard]] const char* to_string(HealthStatus status) noexcept;

/**
 * @brief Decode a task object returned by message/send or tasks/get.
 * @throws ProtocolError if the object lacks an id or status.state.
 */
[[nodiscard]] InvokeResult parse_task_result(const nlohmann::json& task);

/**
 * @brief Blocking client for one agent.
 *
 * Transport and protocol failures are logged and returned as std::nullopt;
 * nothing is retried. Only check_health() distinguishes an unreachable
 * server from a misbehaving one.
 */
class AgentClient {
public:
    /**
     * @param base_url Scheme, host and port, e.g. "http://localhost:8000".
     * @param timeout_seconds Connection and read timeout.
     * @param logger Logger for failures (may be nullptr).
     */
    AgentClient(std::string base_url, int timeout_seconds = 30, std::shared_ptr<Logger> logger = nullptr);

    [[nodiscard]] const std::string& base_url() const noexcept { return base_url_; }

    /// Fetch and cache the agent card.
    std::optional<nlohmann::json> get_agent_card();

    /**
     * @brief Send one text message.
     * @param text Message text.
     * @param capability Capability name placed in params.metadata.
     * @param parameters Capability parameters.
     * @param context_id Optional context to continue.
     */
    std::optional<InvokeResult> send_message(const std::string& text,
                                             const std::string& capability = "echo",
                                             const nlohmann::json& parameters = nlohmann::json::object(),
                                             const std::optional<std::string>& context_id = std::nullopt);

    std::optional<nlohmann::json> get_task(const std::string& task_id);
    std::optional<nlohmann::json> cancel_task(const std::string& task_id);

    HealthStatus check_health();

private:
    /// POST a JSON-RPC request and return its "result".
    nlohmann::json call(const std::string& method, const nlohmann::json& params);
    /// GET a path and parse the JSON body.
    nlohmann::json get_json(const std::string& path);

    std::string base_url_;
    int timeout_seconds_;
    std::shared_ptr<Logger> logger_;
    std::optional<nlohmann::json> card_cache_;
};

} // namespace EchoAgent::Client
