#include "HttpAgentServer.hpp"
#include "agent/handler/JsonRpcHandler.hpp"
#include "processUtils.hpp"

#include <httplib.h>
#include <nlohmann/json.hpp>

#include <exception>
#include <utility>

namespace EchoAgent::Transport {

namespace {
constexpr const char* JsonContentType = "application/json";
}

HttpAgentServer::HttpAgentServer(Card::AgentCard card,
                                 Handler::JsonRpcHandler& handler,
                                 std::shared_ptr<Logger> logger)
    : card_(std::move(card))
    , card_body_(card_.to_json().dump())
    , handler_(handler)
    , logger_(std::move(logger))
    , server_(std::make_unique<httplib::Server>())
{
    register_routes();
}

HttpAgentServer::~HttpAgentServer() {
    stop();
}

void HttpAgentServer::register_routes() {
    server_->Get(Routes::AgentCard, [this](const httplib::Request&, httplib::Response& res) {
        res.set_content(card_body_, JsonContentType);
    });

    server_->Get(Routes::Health, [this](const httplib::Request&, httplib::Response& res) {
        nlohmann::json body{{"status", "healthy"}, {"agent", card_.identity().name}};
        res.set_content(body.dump(), JsonContentType);
    });

    server_->Post(Routes::JsonRpc, [this](const httplib::Request& req, httplib::Response& res) {
        res.set_content(handler_.handle_body(req.body), JsonContentType);
    });

    // Anything escaping a route becomes a JSON-RPC internal error
    server_->set_exception_handler([this](const httplib::Request& req, httplib::Response& res, std::exception_ptr ep) {
        std::string detail = "unknown error";
        try {
            std::rethrow_exception(ep);
        } catch (const std::exception& e) {
            detail = e.what();
        } catch (...) {
            detail = "non-standard exception";
        }
        if (logger_) logger_->error("HttpAgentServer: " + req.method + " " + req.path + " failed: " + detail);
        auto body = Handler::JsonRpcHandler::make_error(nullptr, Handler::ErrorCode::InternalError,
                                                        "Internal error", detail);
        res.status = 500;
        res.set_content(body.dump(), JsonContentType);
    });

    server_->set_logger([this](const httplib::Request& req, const httplib::Response& res) {
        if (logger_) {
            logger_->debug("HttpAgentServer: " + req.method + " " + req.path + " -> " + std::to_string(res.status));
        }
    });
}

bool HttpAgentServer::start(const std::string& host, int port) {
    if (running_) return true;

    int bound = port;
    if (port == 0) {
        bound = server_->bind_to_any_port(host);
    } else if (!server_->bind_to_port(host, port)) {
        bound = -1;
    }
    if (bound <= 0) {
        if (logger_) {
            logger_->error("HttpAgentServer: failed to bind " + host + ":" + std::to_string(port));
        }
        return false;
    }

    if (listener_thread_.joinable()) {
        listener_thread_.join();
    }
    bound_port_ = bound;
    running_ = true;
    listener_thread_ = std::thread([this]() {
        ProcessUtils::set_current_thread_name("HttpListener");
        if (logger_) {
            logger_->debug("HttpAgentServer: listener thread native id " +
                           std::to_string(ProcessUtils::get_native_thread_id()));
        }
        const bool clean = server_->listen_after_bind();
        // Still set only if stop() was never called
        if (running_.exchange(false) && logger_) {
            logger_->error(std::string("HttpAgentServer: listener stopped unexpectedly") +
                           (clean ? "" : " (accept failed)"));
        }
    });

    if (logger_) {
        logger_->info("HttpAgentServer: listening on " + host + ":" + std::to_string(bound) +
                      " as " + card_.identity().name);
    }
    return true;
}

bool HttpAgentServer::start() {
    auto host = http_server_opts::get_listen_host().value_or(std::string("0.0.0.0"));
    auto port = http_server_opts::get_listen_port().value_or(8000);
    if (logger_) logger_->info("HttpAgentServer: resolved listen endpoint " + host + ":" + std::to_string(port));
    return start(host, port);
}

void HttpAgentServer::stop() noexcept {
    const bool was_running = running_.exchange(false);
    if (was_running) {
        server_->stop();
    }
    if (listener_thread_.joinable()) listener_thread_.join();
    bound_port_ = 0;
    if (was_running && logger_) logger_->info("HttpAgentServer: stopped");
}

} // namespace EchoAgent::Transport
