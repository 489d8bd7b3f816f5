// agentMain.cpp - Echo agent server: agent card discovery and JSON-RPC message/send over HTTP.
#include "AgentOptions.hpp"
#include "agent/card/AgentCard.hpp"
#include "agent/handler/JsonRpcHandler.hpp"
#include "agent/task/TaskStore.hpp"
#include "agent/transport/HttpAgentServer.hpp"
#include "capabilities/builtins/BuiltinCapabilities.hpp"
#include "capabilities/registry/CapabilityRegistry.hpp"
#include "options/Options.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <thread>

// Global shutdown flag for signal handlers
static std::atomic<bool> shutdown_requested{false};

static void signal_handler(int) {
    shutdown_requested.store(true, std::memory_order_relaxed);
}

int main(int argc, char* argv[]) {
    using namespace EchoAgent;

    // --- Stage 1: Build logging pipeline ---
    auto logger = std::make_shared<Logger>("EchoAgent");
    auto stdout_sink = std::make_shared<StdoutSink>();
    stdout_sink->set_level(LogLevel::Info);
    logger->add_sink(stdout_sink);

    try {

        // --- Stage 2: Parse CLI/JSON options ---

        // Providers also self-register via static objects; explicit calls are no-ops then
        agent_opts::register_options();
        http_server_opts::register_options();
        shared_opts::Options::set_program_info("echo-agent", "1.0.0");

        std::string opts_err;
        auto parse_res = shared_opts::Options::load_and_parse(argc, argv, opts_err);
        if (parse_res == shared_opts::Options::ParseResult::Help || parse_res == shared_opts::Options::ParseResult::Version) {
            return 0; // help/version already printed
        } else if (parse_res == shared_opts::Options::ParseResult::Error) {
            logger->error(std::string("Failed to parse options: ") + opts_err);
            return 2;
        }
        logger->set_level(agent_opts::get_log_level());

        // --- Stage 3: Capabilities, task store, agent card ---
        Capabilities::CapabilityRegistry registry(logger);
        Capabilities::register_builtin_capabilities(registry);
        logger->info("Registered " + std::to_string(registry.capability_count()) + " capabilities");

        Tasks::TaskStore store(logger);
        Handler::JsonRpcHandler handler(registry, store, logger);
        auto card = Card::AgentCard::build(agent_opts::get_identity(), registry);

        // --- Stage 4: Bring up HTTP server ---
        logger->info("Echo agent starting...");
        Transport::HttpAgentServer server(std::move(card), handler, logger);
        if (!server.start()) {
            logger->error("Failed to start HTTP server");
            return 3;
        }
        logger->info("Agent card available at " + std::string(Transport::Routes::AgentCard));

        std::signal(SIGTERM, signal_handler);
        std::signal(SIGINT, signal_handler);

        while (!shutdown_requested.load(std::memory_order_relaxed) && server.is_running()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
        }

        const bool listener_failed = !shutdown_requested.load(std::memory_order_relaxed);
        logger->info("Shutting down server...");
        server.stop();
        logger->info("Handled " + std::to_string(store.size()) + " tasks");
        if (listener_failed) {
            logger->error("HTTP listener exited without a shutdown request");
            return 3;
        }

    } catch (const std::exception& e) {
        logger->error("Exception in echo agent main: " + std::string(e.what()));
        return 1;
    }

    // --- Stage 5: Final shutdown log ---
    logger->info("Echo agent shut down successfully");

    return 0;
}
