/**
 * @file agent/handler/JsonRpcHandler.cpp
 * @brief Implementation of the JSON-RPC request handler.
 */
#include "JsonRpcHandler.hpp"
#include "capabilities/registry/CapabilityIds.hpp"
#include "message/A2aJson.hpp"
#include "message/AgentErrors.hpp"
#include "IdGenerator.hpp"
#include "logger.hpp"

#include <stdexcept>
#include <variant>

namespace EchoAgent::Handler {

using json = nlohmann::json;

namespace {

/// Signals a JSON-RPC error with a specific code from inside dispatch.
class RpcError : public std::runtime_error {
public:
    RpcError(int code, const std::string& message)
        : std::runtime_error(message), code_(code) {}
    [[nodiscard]] int code() const noexcept { return code_; }
private:
    int code_;
};

const json& require_object_params(const json& params) {
    if (!params.is_object()) {
        throw RpcError(ErrorCode::InvalidParams, "params must be an object");
    }
    return params;
}

std::string require_task_id(const json& params) {
    const auto& p = require_object_params(params);
    auto it = p.find("id");
    if (it == p.end() || !it->is_string() || it->get_ref<const std::string&>().empty()) {
        throw RpcError(ErrorCode::InvalidParams, "params.id must be a non-empty string");
    }
    return it->get<std::string>();
}

bool valid_id(const json& id) {
    return id.is_null() || id.is_string() || id.is_number_integer() || id.is_number_unsigned();
}

} // anonymous namespace

JsonRpcHandler::JsonRpcHandler(const Capabilities::CapabilityRegistry& registry,
                               Tasks::TaskStore& store,
                               std::shared_ptr<Logger> logger)
    : store_(store)
    , executor_(registry, store, logger)
    , logger_(std::move(logger))
{
}

json JsonRpcHandler::make_result(const json& id, json result) {
    return json{{"jsonrpc", "2.0"}, {"id", id}, {"result", std::move(result)}};
}

json JsonRpcHandler::make_error(const json& id, int code, const std::string& message, const json& data) {
    json error{{"code", code}, {"message", message}};
    if (!data.is_null()) {
        error["data"] = data;
    }
    return json{{"jsonrpc", "2.0"}, {"id", id}, {"error", std::move(error)}};
}

std::string JsonRpcHandler::handle_body(const std::string& body) {
    json request = json::parse(body, nullptr, false);
    if (request.is_discarded()) {
        if (logger_) logger_->warning("JsonRpcHandler: rejected malformed JSON body");
        return make_error(nullptr, ErrorCode::ParseError, "Parse error").dump();
    }
    return handle(request).dump();
}

json JsonRpcHandler::handle(const json& request) {
    if (!request.is_object()) {
        return make_error(nullptr, ErrorCode::InvalidRequest, "Request must be an object");
    }

    json id = request.contains("id") ? request["id"] : json(nullptr);
    if (!valid_id(id)) {
        return make_error(nullptr, ErrorCode::InvalidRequest, "id must be a string, integer or null");
    }

    auto version = request.find("jsonrpc");
    if (version == request.end() || !version->is_string() || *version != "2.0") {
        return make_error(id, ErrorCode::InvalidRequest, "jsonrpc must be \"2.0\"");
    }
    auto method = request.find("method");
    if (method == request.end() || !method->is_string()) {
        return make_error(id, ErrorCode::InvalidRequest, "method must be a string");
    }

    const json params = request.contains("params") ? request["params"] : json::object();
    const auto& method_name = method->get_ref<const std::string&>();

    try {
        return make_result(id, dispatch(method_name, params));
    } catch (const RpcError& e) {
        return make_error(id, e.code(), e.what());
    } catch (const ProtocolError& e) {
        return make_error(id, ErrorCode::InvalidParams, e.what());
    } catch (const TaskNotFoundError& e) {
        return make_error(id, ErrorCode::TaskNotFound, e.what());
    } catch (const std::exception& e) {
        if (logger_) logger_->error("JsonRpcHandler: " + method_name + " failed: " + e.what());
        return make_error(id, ErrorCode::InternalError, "Internal error", e.what());
    } catch (...) {
        if (logger_) logger_->error("JsonRpcHandler: " + method_name + " failed with a non-standard exception");
        return make_error(id, ErrorCode::InternalError, "Internal error", "non-standard exception");
    }
}

json JsonRpcHandler::dispatch(const std::string& method, const json& params) {
    if (logger_) logger_->debug("JsonRpcHandler: method " + method);

    if (method == Methods::MessageSend) {
        return on_message_send(params);
    }
    if (method == Methods::TasksGet) {
        return on_tasks_get(params);
    }
    if (method == Methods::TasksCancel) {
        return on_tasks_cancel(params);
    }
    throw RpcError(ErrorCode::MethodNotFound, "Method not found: " + method);
}

json JsonRpcHandler::on_message_send(const json& params) {
    const auto& p = require_object_params(params);

    auto message_it = p.find("message");
    if (message_it == p.end()) {
        throw RpcError(ErrorCode::InvalidParams, "params.message is required");
    }

    Executor::RequestContext context;
    context.message = Protocol::message_from_json(*message_it);
    context.capability = Capabilities::CapabilityIds::Default;

    auto meta_it = p.find("metadata");
    if (meta_it != p.end() && !meta_it->is_null()) {
        if (!meta_it->is_object()) {
            throw RpcError(ErrorCode::InvalidParams, "params.metadata must be an object");
        }
        auto cap_it = meta_it->find("capability");
        if (cap_it != meta_it->end() && !cap_it->is_null()) {
            if (!cap_it->is_string()) {
                throw RpcError(ErrorCode::InvalidParams, "params.metadata.capability must be a string");
            }
            context.capability = cap_it->get<std::string>();
        }
        auto par_it = meta_it->find("parameters");
        if (par_it != meta_it->end() && !par_it->is_null()) {
            if (!par_it->is_object()) {
                throw RpcError(ErrorCode::InvalidParams, "params.metadata.parameters must be an object");
            }
            context.parameters = *par_it;
        }
    }

    // A new task per call, even when the message names an existing task id
    context.task_id = IdGenerator::uuid4();
    const std::string context_id = context.message.context_id.value_or(context.task_id);
    store_.create(context.task_id, context_id);

    Executor::EventChannel channel(context.task_id);
    executor_.execute(context, channel);
    const auto events = channel.drain();

    if (events.empty() || !Protocol::is_final_event(events.back())) {
        throw std::logic_error("task " + context.task_id + " ended without a final status");
    }

    json result = Protocol::task_to_json(store_.get(context.task_id));
    json history = json::array();
    history.push_back(Protocol::message_to_json(context.message));
    result["history"] = std::move(history);

    if (logger_) {
        const auto& final_status = std::get<Protocol::StatusUpdate>(events.back());
        logger_->info("JsonRpcHandler: task " + context.task_id + " [" + context.capability + "] " +
                      Protocol::to_string(final_status.state) + " after " +
                      std::to_string(events.size()) + " events");
    }
    return result;
}

json JsonRpcHandler::on_tasks_get(const json& params) {
    return Protocol::task_to_json(store_.get(require_task_id(params)));
}

json JsonRpcHandler::on_tasks_cancel(const json& params) {
    const std::string task_id = require_task_id(params);
    switch (executor_.cancel(task_id)) {
        case Tasks::CancelOutcome::Canceled:
            return Protocol::task_to_json(store_.get(task_id));
        case Tasks::CancelOutcome::NotCancelable:
            throw RpcError(ErrorCode::TaskNotCancelable, "Task cannot be canceled: " + task_id);
        case Tasks::CancelOutcome::NotFound:
            break;
    }
    throw TaskNotFoundError(task_id);
}

} // namespace EchoAgent::Handler
