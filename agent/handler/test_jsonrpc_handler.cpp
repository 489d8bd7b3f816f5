/**
 * @file test_jsonrpc_handler.cpp
 * @brief JSON-RPC dispatch, error mapping and the agent card document.
 */

#undef NDEBUG
#include "agent/card/AgentCard.hpp"
#include "agent/handler/JsonRpcHandler.hpp"
#include "agent/task/TaskStore.hpp"
#include "capabilities/builtins/BuiltinCapabilities.hpp"
#include "capabilities/registry/CapabilityRegistry.hpp"

#include <cassert>
#include <iostream>
#include <string>

using namespace EchoAgent;
using EchoAgent::Handler::JsonRpcHandler;
namespace ErrorCode = EchoAgent::Handler::ErrorCode;
using nlohmann::json;

namespace {

json send_request(const std::string& text, json metadata = nullptr, json id = 1) {
    json params{
        {"message", {
            {"messageId", "m-1"},
            {"role", "user"},
            {"parts", json::array({json{{"kind", "text"}, {"text", text}}})}
        }}
    };
    if (!metadata.is_null()) params["metadata"] = std::move(metadata);
    return json{{"jsonrpc", "2.0"}, {"id", std::move(id)}, {"method", "message/send"}, {"params", std::move(params)}};
}

std::string first_artifact_text(const json& result) {
    return result["artifacts"][0]["parts"][0]["text"].get<std::string>();
}

int error_code(const json& response) {
    return response["error"]["code"].get<int>();
}

struct Fixture {
    Capabilities::CapabilityRegistry registry;
    Tasks::TaskStore store;
    JsonRpcHandler handler{registry, store};

    Fixture() { Capabilities::register_builtin_capabilities(registry); }
};

} // namespace

void test_message_send_echo() {
    std::cout << "\n=== Testing message/send echo ===\n";
    Fixture f;
    auto response = f.handler.handle(send_request("Hello World!"));

    assert(response["jsonrpc"] == "2.0");
    assert(response["id"] == 1);
    assert(!response.contains("error"));
    const auto& result = response["result"];
    assert(result["kind"] == "task");
    assert(result["status"]["state"] == "completed");
    assert(result["status"]["timestamp"].is_string());
    assert(result["artifacts"].size() == 1);
    assert(result["artifacts"][0]["name"] == "echo_response");
    assert(first_artifact_text(result) == "Hello World!");
    assert(result["contextId"] == result["id"]);
    assert(result["history"][0]["messageId"] == "m-1");
    assert(!result.contains("metadata"));
    assert(f.store.size() == 1);
    std::cout << "  message/send echo test passed!\n";
}

void test_message_send_prefix_and_context() {
    std::cout << "\n=== Testing message/send with prefix ===\n";
    Fixture f;
    auto request = send_request("hi", json{{"capability", "echo_with_prefix"}, {"parameters", {{"prefix", "Bot: "}}}}, "req-7");
    request["params"]["message"]["contextId"] = "conversation-1";

    auto response = f.handler.handle(request);
    assert(response["id"] == "req-7");
    assert(first_artifact_text(response["result"]) == "Bot: hi");
    assert(response["result"]["contextId"] == "conversation-1");

    auto defaulted = f.handler.handle(send_request("hi", json{{"capability", "echo_with_prefix"}}));
    assert(first_artifact_text(defaulted["result"]) == "Echo: hi");
    std::cout << "  Prefix test passed!\n";
}

void test_new_task_per_call() {
    std::cout << "\n=== Testing Task Per Call ===\n";
    Fixture f;
    auto a = f.handler.handle(send_request("same"));
    auto b = f.handler.handle(send_request("same"));
    assert(a["result"]["id"] != b["result"]["id"]);
    assert(f.store.size() == 2);
    std::cout << "  Task per call test passed!\n";
}

void test_message_send_failures_are_results() {
    std::cout << "\n=== Testing Failed Tasks ===\n";
    Fixture f;
    auto unknown = f.handler.handle(send_request("hi", json{{"capability", "translate"}}));
    assert(!unknown.contains("error"));
    assert(unknown["result"]["status"]["state"] == "failed");
    assert(unknown["result"]["artifacts"].empty());
    assert(unknown["result"]["metadata"]["errorType"] == "UnknownCapability");

    auto bad_prefix = f.handler.handle(send_request("hi", json{{"capability", "echo_with_prefix"}, {"parameters", {{"prefix", 1}}}}));
    assert(bad_prefix["result"]["status"]["state"] == "failed");
    assert(bad_prefix["result"]["metadata"]["errorType"] == "CapabilityError");

    f.registry.register_function("throws_int", "Throws an int",
        [](const std::string&, const json&) -> std::string { throw 42; });
    auto thrown = f.handler.handle(send_request("hi", json{{"capability", "throws_int"}}));
    assert(!thrown.contains("error"));
    assert(thrown["result"]["status"]["state"] == "failed");
    assert(thrown["result"]["metadata"]["errorType"] == "CapabilityError");
    std::cout << "  Failed tasks test passed!\n";
}

void test_empty_parts() {
    std::cout << "\n=== Testing Empty Parts ===\n";
    Fixture f;
    json request = send_request("unused");
    request["params"]["message"]["parts"] = json::array();
    auto response = f.handler.handle(request);
    assert(response["result"]["status"]["state"] == "completed");
    assert(first_artifact_text(response["result"]).empty());
    std::cout << "  Empty parts test passed!\n";
}

void test_protocol_errors() {
    std::cout << "\n=== Testing Protocol Errors ===\n";
    Fixture f;

    auto parse = json::parse(f.handler.handle_body("{not json"));
    assert(error_code(parse) == ErrorCode::ParseError);
    assert(parse["id"].is_null());

    assert(error_code(f.handler.handle(json::array())) == ErrorCode::InvalidRequest);
    assert(error_code(f.handler.handle(json{{"id", 1}, {"method", "message/send"}})) == ErrorCode::InvalidRequest);
    assert(error_code(f.handler.handle(json{{"jsonrpc", "2.0"}, {"id", 1}})) == ErrorCode::InvalidRequest);
    assert(error_code(f.handler.handle(json{{"jsonrpc", "2.0"}, {"id", json::object()}, {"method", "x"}})) == ErrorCode::InvalidRequest);

    auto unknown = f.handler.handle(json{{"jsonrpc", "2.0"}, {"id", 3}, {"method", "tasks/resubscribe"}});
    assert(error_code(unknown) == ErrorCode::MethodNotFound);
    assert(unknown["id"] == 3);

    auto no_message = f.handler.handle(json{{"jsonrpc", "2.0"}, {"id", 4}, {"method", "message/send"}, {"params", json::object()}});
    assert(error_code(no_message) == ErrorCode::InvalidParams);

    json bad_part = send_request("x");
    bad_part["params"]["message"]["parts"] = json::array({json{{"kind", "image"}}});
    assert(error_code(f.handler.handle(bad_part)) == ErrorCode::InvalidParams);

    json bad_role = send_request("x");
    bad_role["params"]["message"]["role"] = "system";
    assert(error_code(f.handler.handle(bad_role)) == ErrorCode::InvalidParams);

    assert(error_code(f.handler.handle(send_request("x", json{{"capability", 5}}))) == ErrorCode::InvalidParams);
    assert(error_code(f.handler.handle(send_request("x", json{{"parameters", "prefix"}}))) == ErrorCode::InvalidParams);
    assert(error_code(f.handler.handle(send_request("x", json::array({1})))) == ErrorCode::InvalidParams);

    // None of the rejected requests created a task
    assert(f.store.size() == 0);
    std::cout << "  Protocol errors test passed!\n";
}

void test_tasks_get_and_cancel() {
    std::cout << "\n=== Testing tasks/get and tasks/cancel ===\n";
    Fixture f;
    auto sent = f.handler.handle(send_request("keep me"));
    const std::string task_id = sent["result"]["id"].get<std::string>();

    auto got = f.handler.handle(json{{"jsonrpc", "2.0"}, {"id", 2}, {"method", "tasks/get"}, {"params", {{"id", task_id}}}});
    assert(got["result"]["id"] == task_id);
    assert(got["result"]["status"]["state"] == "completed");
    assert(first_artifact_text(got["result"]) == "keep me");

    auto missing = f.handler.handle(json{{"jsonrpc", "2.0"}, {"id", 3}, {"method", "tasks/get"}, {"params", {{"id", "nope"}}}});
    assert(error_code(missing) == ErrorCode::TaskNotFound);

    auto no_id = f.handler.handle(json{{"jsonrpc", "2.0"}, {"id", 4}, {"method", "tasks/get"}, {"params", json::object()}});
    assert(error_code(no_id) == ErrorCode::InvalidParams);

    auto finished = f.handler.handle(json{{"jsonrpc", "2.0"}, {"id", 5}, {"method", "tasks/cancel"}, {"params", {{"id", task_id}}}});
    assert(error_code(finished) == ErrorCode::TaskNotCancelable);

    f.store.create("pending");
    auto canceled = f.handler.handle(json{{"jsonrpc", "2.0"}, {"id", 6}, {"method", "tasks/cancel"}, {"params", {{"id", "pending"}}}});
    assert(canceled["result"]["status"]["state"] == "canceled");

    auto cancel_missing = f.handler.handle(json{{"jsonrpc", "2.0"}, {"id", 7}, {"method", "tasks/cancel"}, {"params", {{"id", "nope"}}}});
    assert(error_code(cancel_missing) == ErrorCode::TaskNotFound);
    std::cout << "  tasks/get and tasks/cancel test passed!\n";
}

void test_agent_card_document() {
    std::cout << "\n=== Testing Agent Card ===\n";
    Capabilities::CapabilityRegistry registry;
    Capabilities::register_builtin_capabilities(registry);

    Card::AgentIdentity identity;
    identity.name = "EchoAgent";
    identity.url = "http://127.0.0.1:9000";
    auto card = Card::AgentCard::build(identity, registry);

    assert(card.skills().size() == 2);
    assert(card.has_skill("echo"));
    assert(card.has_skill("echo_with_prefix"));
    assert(!card.has_skill("translate"));

    auto doc = card.to_json();
    assert(doc["name"] == "EchoAgent");
    assert(doc["version"] == "1.0.0");
    assert(doc["url"] == "http://127.0.0.1:9000");
    assert(doc["protocolVersion"] == Card::AgentCard::ProtocolVersion);
    assert(doc["capabilities"]["streaming"] == false);
    assert(doc["defaultInputModes"] == json::array({"text"}));
    assert(doc["skills"].size() == 2);
    assert(doc["skills"][0]["id"] == "echo");
    assert(doc["skills"][0]["examples"][0] == "Hello World!");
    assert(doc["skills"][1]["id"] == "echo_with_prefix");
    assert(doc["skills"][1]["tags"] == json::array({"echo", "prefix"}));
    assert(doc["skills"][1]["inputModes"] == json::array({"text"}));

    // Every advertised skill resolves in the registry
    for (const auto& skill : card.skills()) {
        assert(registry.resolve(skill.id) != nullptr);
    }
    std::cout << "  Agent card test passed!\n";
}

int main() {
    test_message_send_echo();
    test_message_send_prefix_and_context();
    test_new_task_per_call();
    test_message_send_failures_are_results();
    test_empty_parts();
    test_protocol_errors();
    test_tasks_get_and_cancel();
    test_agent_card_document();

    std::cout << "\n=== All JSON-RPC handler tests passed! ===\n";
    return 0;
}
