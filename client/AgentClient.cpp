#include "client/AgentClient.hpp"
#include "message/AgentErrors.hpp"
#include "IdGenerator.hpp"
#include "logger.hpp"

#include <httplib.h>

namespace EchoAgent::Client {

using json = nlohmann::json;

namespace {
constexpr const char* JsonContentType = "application/json";
}

const char* to_string(HealthStatus status) noexcept {
    switch (status) {
        case HealthStatus::Healthy:     return "healthy";
        case HealthStatus::Unhealthy:   return "unhealthy";
        case HealthStatus::Unreachable: return "unreachable";
    }
    return "unknown";
}

InvokeResult parse_task_result(const json& task) {
    if (!task.is_object() || !task.contains("id") || !task["id"].is_string()) {
        throw ProtocolError("task result has no string 'id'");
    }
    if (!task.contains("status") || !task["status"].is_object() ||
        !task["status"].contains("state") || !task["status"]["state"].is_string()) {
        throw ProtocolError("task result has no status.state");
    }

    InvokeResult result;
    result.task_id = task["id"].get<std::string>();
    result.context_id = task.value("contextId", std::string{});
    result.state = task["status"]["state"].get<std::string>();
    if (task.contains("metadata") && task["metadata"].is_object()) {
        result.metadata = task["metadata"];
    }

    if (task.contains("artifacts") && task["artifacts"].is_array()) {
        for (const auto& artifact : task["artifacts"]) {
            if (!artifact.contains("parts") || !artifact["parts"].is_array()) continue;
            for (const auto& part : artifact["parts"]) {
                if (part.value("kind", std::string{}) == "text" && part.contains("text") && part["text"].is_string()) {
                    result.text = part["text"].get<std::string>();
                    return result;
                }
            }
        }
    }
    return result;
}

AgentClient::AgentClient(std::string base_url, int timeout_seconds, std::shared_ptr<Logger> logger)
    : base_url_(std::move(base_url))
    , timeout_seconds_(timeout_seconds > 0 ? timeout_seconds : 30)
    , logger_(std::move(logger))
{
    while (!base_url_.empty() && base_url_.back() == '/') {
        base_url_.pop_back();
    }
}

json AgentClient::get_json(const std::string& path) {
    httplib::Client cli(base_url_);
    cli.set_connection_timeout(timeout_seconds_);
    cli.set_read_timeout(timeout_seconds_);

    auto res = cli.Get(path);
    if (!res) {
        throw TransportError("connection to " + base_url_ + " failed: " + httplib::to_string(res.error()));
    }
    if (res->status != 200) {
        throw TransportError("GET " + path + " returned HTTP " + std::to_string(res->status), res->status);
    }
    json body = json::parse(res->body, nullptr, false);
    if (body.is_discarded()) {
        throw ProtocolError("GET " + path + " returned malformed JSON");
    }
    return body;
}

json AgentClient::call(const std::string& method, const json& params) {
    json request{
        {"jsonrpc", "2.0"},
        {"id", "client-" + IdGenerator::uuid4()},
        {"method", method},
        {"params", params}
    };

    httplib::Client cli(base_url_);
    cli.set_connection_timeout(timeout_seconds_);
    cli.set_read_timeout(timeout_seconds_);

    auto res = cli.Post("/", request.dump(), JsonContentType);
    if (!res) {
        throw TransportError("connection to " + base_url_ + " failed: " + httplib::to_string(res.error()));
    }
    json body = json::parse(res->body, nullptr, false);
    if (body.is_discarded()) {
        throw TransportError(method + " returned HTTP " + std::to_string(res->status) + " with a non-JSON body",
                             res->status);
    }
    if (body.contains("error")) {
        const auto& error = body["error"];
        throw ProtocolError(method + " failed (" + std::to_string(error.value("code", 0)) + "): " +
                            error.value("message", std::string("unknown error")));
    }
    if (res->status != 200) {
        throw TransportError(method + " returned HTTP " + std::to_string(res->status), res->status);
    }
    if (!body.contains("result")) {
        throw ProtocolError(method + " response has neither result nor error");
    }
    return body["result"];
}

std::optional<json> AgentClient::get_agent_card() {
    if (card_cache_) {
        return card_cache_;
    }
    try {
        card_cache_ = get_json("/.well-known/agent-card.json");
        return card_cache_;
    } catch (const std::exception& e) {
        if (logger_) logger_->error(std::string("Error getting agent card: ") + e.what());
        return std::nullopt;
    }
}

std::optional<InvokeResult> AgentClient::send_message(const std::string& text,
                                                      const std::string& capability,
                                                      const json& parameters,
                                                      const std::optional<std::string>& context_id) {
    json message{
        {"kind", "message"},
        {"messageId", "client-" + IdGenerator::uuid4()},
        {"role", "user"},
        {"parts", json::array({json{{"kind", "text"}, {"text", text}}})}
    };
    if (context_id) {
        message["contextId"] = *context_id;
    }
    json params{
        {"message", std::move(message)},
        {"metadata", {{"capability", capability}, {"parameters", parameters}}}
    };

    try {
        auto result = parse_task_result(call("message/send", params));
        if (!result.completed() && logger_) {
            logger_->warning("Task " + result.task_id + " ended " + result.state + ": " +
                             result.metadata.value("error", std::string{}));
        }
        return result;
    } catch (const std::exception& e) {
        if (logger_) logger_->error(std::string("Error invoking agent: ") + e.what());
        return std::nullopt;
    }
}

std::optional<json> AgentClient::get_task(const std::string& task_id) {
    try {
        return call("tasks/get", json{{"id", task_id}});
    } catch (const std::exception& e) {
        if (logger_) logger_->error(std::string("Error getting task: ") + e.what());
        return std::nullopt;
    }
}

std::optional<json> AgentClient::cancel_task(const std::string& task_id) {
    try {
        return call("tasks/cancel", json{{"id", task_id}});
    } catch (const std::exception& e) {
        if (logger_) logger_->error(std::string("Error canceling task: ") + e.what());
        return std::nullopt;
    }
}

HealthStatus AgentClient::check_health() {
    try {
        auto body = get_json("/health");
        return body.value("status", std::string{}) == "healthy" ? HealthStatus::Healthy : HealthStatus::Unhealthy;
    } catch (const TransportError& e) {
        if (logger_) logger_->debug(std::string("Health check failed: ") + e.what());
        return e.http_status() == 0 ? HealthStatus::Unreachable : HealthStatus::Unhealthy;
    } catch (const std::exception& e) {
        if (logger_) logger_->debug(std::string("Health check failed: ") + e.what());
        return HealthStatus::Unhealthy;
    }
}

} // namespace EchoAgent::Client
