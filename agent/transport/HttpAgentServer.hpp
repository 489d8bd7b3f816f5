/**
 * \defgroup transport_module Agent Transport Module
 * \brief HTTP front end of the agent: discovery, JSON-RPC and health routes.
 *
 * HttpAgentServer owns the cpp-httplib server and the listener thread. All
 * protocol work is delegated to JsonRpcHandler; this module only maps HTTP
 * requests onto it and turns stray exceptions into JSON-RPC internal errors.
 * @{
 */
#pragma once

#include "agent/card/AgentCard.hpp"
#include "logger.hpp"

#include <atomic>
#include <memory>
#include <optional>
#include <string>
#include <thread>

namespace httplib { class Server; }

// Accessors provided by the listener options provider (auto-registered once)
namespace http_server_opts {
void register_options();
std::optional<std::string> get_listen_host();
std::optional<int> get_listen_port();
}

namespace EchoAgent::Handler { class JsonRpcHandler; }

namespace EchoAgent::Transport {

/// Route paths served by HttpAgentServer.
namespace Routes {
    constexpr const char* AgentCard = "/.well-known/agent-card.json";
    constexpr const char* JsonRpc   = "/";
    constexpr const char* Health    = "/health";
}

/**
 * \brief HTTP server for the agent.
 *
 * Routes:
 * - GET  /.well-known/agent-card.json  agent card JSON
 * - POST /                             JSON-RPC 2.0 (message/send, tasks/get, tasks/cancel)
 * - GET  /health                       {"status":"healthy","agent":<name>}
 */
class HttpAgentServer {
public:
    HttpAgentServer(Card::AgentCard card,
                    Handler::JsonRpcHandler& handler,
                    std::shared_ptr<Logger> logger);
    ~HttpAgentServer();

    HttpAgentServer(const HttpAgentServer&) = delete;
    HttpAgentServer& operator=(const HttpAgentServer&) = delete;

    /**
     * \brief Bind and start the listener thread.
     * \param host Address to bind.
     * \param port TCP port; 0 binds an ephemeral port (see port()).
     * \return true on success, false if binding fails.
     */
    bool start(const std::string& host, int port);

    /**
     * \brief Convenience overload that pulls host/port from `http_server_opts`.
     */
    bool start();

    /**
     * \brief Stop accepting requests and join the listener thread.
     *
     * Safe to call multiple times, and after the listener has exited on its
     * own (is_running() already false).
     */
    void stop() noexcept;

    /// False once stop() was called or the listener exited unexpectedly.
    [[nodiscard]] bool is_running() const noexcept { return running_.load(); }

    /// Port actually bound, or 0 when not running.
    [[nodiscard]] int port() const noexcept { return bound_port_.load(); }

    [[nodiscard]] const Card::AgentCard& card() const noexcept { return card_; }

private:
    void register_routes();

private:
    Card::AgentCard card_;
    std::string card_body_;
    Handler::JsonRpcHandler& handler_;
    std::shared_ptr<Logger> logger_;

    std::unique_ptr<httplib::Server> server_;
    std::thread listener_thread_{};
    std::atomic<bool> running_{false};
    std::atomic<int> bound_port_{0};
};

} // namespace EchoAgent::Transport

/// @}
