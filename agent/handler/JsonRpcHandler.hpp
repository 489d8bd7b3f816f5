/**
 * @file agent/handler/JsonRpcHandler.hpp
 * @brief JSON-RPC 2.0 endpoint: message/send, tasks/get, tasks/cancel.
 */
#pragma once

#include "agent/executor/TaskExecutor.hpp"
#include "agent/task/TaskStore.hpp"

#include <nlohmann/json.hpp>

#include <memory>
#include <string>

class Logger;

namespace EchoAgent::Capabilities {
class CapabilityRegistry;
}

namespace EchoAgent::Handler {

/// JSON-RPC error codes returned by the agent.
namespace ErrorCode {
    constexpr int ParseError       = -32700;
    constexpr int InvalidRequest   = -32600;
    constexpr int MethodNotFound   = -32601;
    constexpr int InvalidParams    = -32602;
    constexpr int InternalError    = -32603;
    constexpr int TaskNotFound     = -32001;
    constexpr int TaskNotCancelable = -32002;
}

namespace Methods {
    constexpr const char* MessageSend = "message/send";
    constexpr const char* TasksGet    = "tasks/get";
    constexpr const char* TasksCancel = "tasks/cancel";
}

/**
 * @brief Decodes JSON-RPC requests and drives the executor.
 *
 * message/send creates a fresh task per call, runs the executor to
 * completion on the calling thread and answers with the resulting task.
 * Every failure is answered with a JSON-RPC error object; handle() and
 * handle_body() do not throw.
 */
class JsonRpcHandler {
public:
    JsonRpcHandler(const Capabilities::CapabilityRegistry& registry,
                   Tasks::TaskStore& store,
                   std::shared_ptr<Logger> logger = nullptr);

    /**
     * @brief Handle a raw request body.
     * @return Serialized JSON-RPC response (a parse error if the body is not JSON).
     */
    [[nodiscard]] std::string handle_body(const std::string& body);

    /**
     * @brief Handle an already parsed request.
     * @return JSON-RPC response object with either "result" or "error".
     */
    [[nodiscard]] nlohmann::json handle(const nlohmann::json& request);

    [[nodiscard]] static nlohmann::json make_result(const nlohmann::json& id, nlohmann::json result);
    [[nodiscard]] static nlohmann::json make_error(const nlohmann::json& id, int code,
                                                   const std::string& message,
                                                   const nlohmann::json& data = nullptr);

private:
    nlohmann::json dispatch(const std::string& method, const nlohmann::json& params);
    nlohmann::json on_message_send(const nlohmann::json& params);
    nlohmann::json on_tasks_get(const nlohmann::json& params);
    nlohmann::json on_tasks_cancel(const nlohmann::json& params);

    Tasks::TaskStore& store_;
    Executor::TaskExecutor executor_;
    std::shared_ptr<Logger> logger_;
};

} // namespace EchoAgent::Handler
