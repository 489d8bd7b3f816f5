/**
 * @file test_http_roundtrip.cpp
 * @brief Agent server and client talking over a loopback socket.
 */

#undef NDEBUG
#include "agent/card/AgentCard.hpp"
#include "agent/handler/JsonRpcHandler.hpp"
#include "agent/task/TaskStore.hpp"
#include "agent/transport/HttpAgentServer.hpp"
#include "capabilities/builtins/BuiltinCapabilities.hpp"
#include "capabilities/registry/CapabilityRegistry.hpp"
#include "client/AgentClient.hpp"
#include "client/ClientCommands.hpp"

#include <httplib.h>

#include <netinet/in.h>
#include <sys/socket.h>

#include <cassert>
#include <chrono>
#include <iostream>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

using namespace EchoAgent;
using nlohmann::json;

namespace {

struct RunningAgent {
    std::shared_ptr<Logger> logger;
    std::shared_ptr<VectorSink> sink;
    Capabilities::CapabilityRegistry registry;
    Tasks::TaskStore store;
    Handler::JsonRpcHandler handler;
    Transport::HttpAgentServer server;

    RunningAgent()
        : logger(std::make_shared<Logger>("test"))
        , sink(std::make_shared<VectorSink>())
        , registry(logger)
        , store(logger)
        , handler(registry, store, logger)
        , server(make_card(registry), handler, logger)
    {
        sink->set_level(LogLevel::Debug);
        logger->add_sink(sink);
        bool started = server.start("127.0.0.1", 0);
        assert(started);
        assert(server.port() > 0);
    }

    ~RunningAgent() { server.stop(); }

    std::string url() const { return "http://127.0.0.1:" + std::to_string(server.port()); }

    static Card::AgentCard make_card(Capabilities::CapabilityRegistry& registry) {
        Capabilities::register_builtin_capabilities(registry);
        Card::AgentIdentity identity;
        identity.name = "EchoAgent";
        return Card::AgentCard::build(identity, registry);
    }
};

/// Descriptor of the listening socket bound to @p port, or -1.
int find_listening_socket(int port) {
    for (int fd = 3; fd < 1024; ++fd) {
        int accepting = 0;
        socklen_t len = sizeof(accepting);
        if (getsockopt(fd, SOL_SOCKET, SO_ACCEPTCONN, &accepting, &len) != 0 || !accepting) continue;
        sockaddr_in addr{};
        socklen_t addr_len = sizeof(addr);
        if (getsockname(fd, reinterpret_cast<sockaddr*>(&addr), &addr_len) != 0) continue;
        if (addr.sin_family == AF_INET && ntohs(addr.sin_port) == port) return fd;
    }
    return -1;
}

} // namespace

void test_listener_failure_clears_running() {
    std::cout << "\n=== Testing Listener Failure ===\n";
    RunningAgent agent;
    assert(agent.server.is_running());

    int fd = find_listening_socket(agent.server.port());
    assert(fd >= 0);
    // Accept fails from here on, ending the listener without a stop() call
    shutdown(fd, SHUT_RDWR);

    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while (agent.server.is_running() && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }
    assert(!agent.server.is_running());
    assert(agent.sink->contains("listener stopped unexpectedly"));

    // stop() still joins the exited listener and stays idempotent
    agent.server.stop();
    agent.server.stop();
    assert(agent.server.port() == 0);
    std::cout << "  Listener failure test passed!\n";
}

void test_discovery_and_health() {
    std::cout << "\n=== Testing Discovery and Health ===\n";
    RunningAgent agent;
    Client::AgentClient client(agent.url(), 5);

    assert(client.check_health() == Client::HealthStatus::Healthy);

    auto card = client.get_agent_card();
    assert(card.has_value());
    assert((*card)["name"] == "EchoAgent");
    std::vector<std::string> ids;
    for (const auto& skill : (*card)["skills"]) ids.push_back(skill["id"].get<std::string>());
    assert((ids == std::vector<std::string>{"echo", "echo_with_prefix"}));

    httplib::Client raw(agent.url());
    auto health = raw.Get("/health");
    assert(health && health->status == 200);
    auto body = json::parse(health->body);
    assert(body["status"] == "healthy");
    assert(body["agent"] == "EchoAgent");

    // The legacy REST profile is not served
    auto legacy = raw.Get("/agent/card");
    assert(legacy && legacy->status == 404);
    std::cout << "  Discovery and health test passed!\n";
}

void test_message_send_roundtrip() {
    std::cout << "\n=== Testing message/send Roundtrip ===\n";
    RunningAgent agent;
    Client::AgentClient client(agent.url(), 5);

    auto echoed = client.send_message("Hello World!");
    assert(echoed.has_value());
    assert(echoed->completed());
    assert(echoed->text == std::optional<std::string>("Hello World!"));

    auto prefixed = client.send_message("hi", "echo_with_prefix", json{{"prefix", "Bot: "}});
    assert(prefixed && prefixed->text == std::optional<std::string>("Bot: hi"));

    auto with_context = client.send_message("again", "echo", json::object(), std::string("ctx-42"));
    assert(with_context && with_context->context_id == "ctx-42");

    auto failed = client.send_message("hi", "translate");
    assert(failed.has_value());
    assert(failed->state == "failed");
    assert(!failed->text.has_value());
    assert(failed->metadata["errorType"] == "UnknownCapability");

    auto task = client.get_task(echoed->task_id);
    assert(task && (*task)["status"]["state"] == "completed");
    assert(!client.get_task("missing").has_value());
    assert(!client.cancel_task(echoed->task_id).has_value());

    assert(agent.store.size() == 4);
    std::cout << "  message/send roundtrip test passed!\n";
}

void test_malformed_body() {
    std::cout << "\n=== Testing Malformed Body ===\n";
    RunningAgent agent;
    httplib::Client raw(agent.url());
    auto res = raw.Post("/", "{\"jsonrpc\": ", "application/json");
    assert(res && res->status == 200);
    auto body = json::parse(res->body);
    assert(body["error"]["code"] == Handler::ErrorCode::ParseError);
    std::cout << "  Malformed body test passed!\n";
}

void test_concurrent_clients() {
    std::cout << "\n=== Testing Concurrent Clients ===\n";
    RunningAgent agent;
    constexpr int THREADS = 4;
    constexpr int REQUESTS = 10;
    std::vector<int> bad(THREADS, 0);
    std::vector<std::thread> threads;
    for (int t = 0; t < THREADS; ++t) {
        threads.emplace_back([&agent, &bad, t]() {
            Client::AgentClient client(agent.url(), 5);
            for (int i = 0; i < REQUESTS; ++i) {
                const std::string text = "c" + std::to_string(t) + "-" + std::to_string(i);
                auto result = client.send_message(text);
                if (!result || result->text != std::optional<std::string>(text)) ++bad[t];
            }
        });
    }
    for (auto& th : threads) th.join();
    for (int b : bad) assert(b == 0);
    assert(agent.store.size() == THREADS * REQUESTS);
    std::cout << "  Concurrent clients test passed!\n";
}

void test_client_commands() {
    std::cout << "\n=== Testing Client Commands ===\n";
    RunningAgent agent;
    Client::AgentClient client(agent.url(), 5);

    std::ostringstream echo_out;
    assert(Client::run_echo(client, "Hello World!", "echo", std::nullopt, echo_out) == Client::ExitCode::Ok);
    assert(echo_out.str() == "Response: Hello World!\n");

    std::ostringstream prefix_out;
    assert(Client::run_echo(client, "hi", "echo_with_prefix", std::string("Bot: "), prefix_out) == Client::ExitCode::Ok);
    assert(prefix_out.str() == "Response: Bot: hi\n");

    // The prefix only applies to echo_with_prefix
    std::ostringstream ignored_out;
    assert(Client::run_echo(client, "hi", "echo", std::string("Bot: "), ignored_out) == Client::ExitCode::Ok);
    assert(ignored_out.str() == "Response: hi\n");

    std::ostringstream info_out;
    assert(Client::run_info(client, info_out) == Client::ExitCode::Ok);
    assert(info_out.str().find("Agent Name: EchoAgent") != std::string::npos);
    assert(info_out.str().find("  - echo_with_prefix: ") != std::string::npos);

    std::ostringstream health_out;
    assert(Client::run_health(client, health_out) == Client::ExitCode::Ok);
    assert(health_out.str() == "Server is healthy\n");
    std::cout << "  Client commands test passed!\n";
}

void test_interactive_shell() {
    std::cout << "\n=== Testing Interactive Shell ===\n";
    RunningAgent agent;
    Client::AgentClient client(agent.url(), 5);

    std::istringstream in("hello\n/prefix Bot: \nhi\n/clear\nplain\n\ninfo\nquit\nnever sent\n");
    std::ostringstream out;
    Client::InteractiveShell shell(client, in, out);
    assert(shell.run() == Client::ExitCode::Ok);
    assert(!shell.prefix().has_value());

    const std::string text = out.str();
    assert(text.find("A2A Echo Agent Interactive Mode") != std::string::npos);
    assert(text.find("Agent: hello\n") != std::string::npos);
    assert(text.find("Prefix set to: 'Bot: '") != std::string::npos);
    assert(text.find("Agent: Bot: hi\n") != std::string::npos);
    assert(text.find("Prefix cleared") != std::string::npos);
    assert(text.find("Agent: plain\n") != std::string::npos);
    assert(text.find("Agent Name: EchoAgent") != std::string::npos);
    assert(text.find("never sent") == std::string::npos);
    // hello, hi, plain
    assert(agent.store.size() == 3);
    std::cout << "  Interactive shell test passed!\n";
}

void test_unreachable_server() {
    std::cout << "\n=== Testing Unreachable Server ===\n";
    std::string url;
    {
        RunningAgent agent;
        url = agent.url();
    }
    Client::AgentClient client(url, 1);
    assert(client.check_health() == Client::HealthStatus::Unreachable);
    assert(!client.send_message("hi").has_value());
    assert(!client.get_agent_card().has_value());

    std::ostringstream out;
    assert(Client::run_echo(client, "hi", "echo", std::nullopt, out) == Client::ExitCode::Unreachable);
    assert(out.str().find("Server is not reachable") != std::string::npos);

    std::ostringstream health_out;
    assert(Client::run_health(client, health_out) == Client::ExitCode::Unreachable);
    assert(health_out.str() == "Server is not reachable\n");
    std::cout << "  Unreachable server test passed!\n";
}

int main() {
    test_discovery_and_health();
    test_message_send_roundtrip();
    test_malformed_body();
    test_concurrent_clients();
    test_client_commands();
    test_interactive_shell();
    test_unreachable_server();
    test_listener_failure_clears_running();

    std::cout << "\n=== All HTTP roundtrip tests passed! ===\n";
    return 0;
}
