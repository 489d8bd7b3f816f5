// ClientOptions.cpp - Client options and subcommands provider with auto-registration
#include "ClientOptions.hpp"
#include "options/Options.hpp"

#include <atomic>
#include <mutex>

namespace {
    std::mutex g_client_opts_mtx;
    std::string g_server_url = "http://localhost:8000";
    int g_timeout_seconds = 30;
    std::string g_log_level = "warning";
    client_opts::Command g_command = client_opts::Command::None;
    client_opts::EchoArgs g_echo_args;
    std::atomic<bool> g_client_registered{false};
}

namespace client_opts {

void register_options() {
    bool expected = false;
    if (!g_client_registered.compare_exchange_strong(expected, true)) {
        return; // already registered
    }

    shared_opts::Options::add_provider([](CLI::App& app, const nlohmann::json& j){
        std::string url_default = "http://localhost:8000";
        int timeout_default = 30;
        std::string level_default = "warning";

        if (j.contains("server")) {
            shared_opts::read_config_string(j["server"], "url", url_default);
        }
        if (j.contains("client")) {
            shared_opts::read_config_int(j["client"], "timeout_seconds", 1, 3600, timeout_default);
        }
        if (j.contains("logging")) {
            shared_opts::read_config_string(j["logging"], "level", level_default);
        }

        {
            std::lock_guard<std::mutex> lk(g_client_opts_mtx);
            g_server_url = url_default;
            g_timeout_seconds = timeout_default;
            g_log_level = level_default;
            g_command = Command::None;
            g_echo_args = EchoArgs{};
        }

        app.add_option("--server-url", g_server_url, "Agent base URL (default http://localhost:8000)")->group("Client");
        app.add_option("--timeout", g_timeout_seconds, "HTTP timeout in seconds (default 30)")
            ->check(CLI::Range(1, 3600))
            ->group("Client");
        app.add_option("--log-level", g_log_level, "Log level (debug, info, warning, error, critical)")
            ->check(CLI::IsMember({"debug", "info", "warning", "warn", "error", "critical"}, CLI::ignore_case))
            ->group("Logging");

        auto* info = app.add_subcommand("info", "Get agent information");
        info->callback([]() { g_command = Command::Info; });

        auto* echo = app.add_subcommand("echo", "Send a message to the echo agent");
        echo->add_option("message", g_echo_args.message, "Message to send")->required();
        echo->add_option("--capability", g_echo_args.capability, "Capability to use (echo, echo_with_prefix)");
        echo->add_option("--prefix", g_echo_args.prefix, "Prefix for echo_with_prefix capability");
        echo->callback([]() { g_command = Command::Echo; });

        auto* interactive = app.add_subcommand("interactive", "Interactive mode for chatting with the echo agent");
        interactive->callback([]() { g_command = Command::Interactive; });

        auto* health = app.add_subcommand("health", "Check server health");
        health->callback([]() { g_command = Command::Health; });

        app.require_subcommand(1);
    });
}

std::string get_server_url() {
    std::lock_guard<std::mutex> lk(g_client_opts_mtx);
    return g_server_url;
}

int get_timeout_seconds() {
    std::lock_guard<std::mutex> lk(g_client_opts_mtx);
    return g_timeout_seconds;
}

LogLevel get_log_level() {
    std::lock_guard<std::mutex> lk(g_client_opts_mtx);
    return parse_log_level(g_log_level).value_or(LogLevel::Warning);
}

Command get_command() {
    std::lock_guard<std::mutex> lk(g_client_opts_mtx);
    return g_command;
}

EchoArgs get_echo_args() {
    std::lock_guard<std::mutex> lk(g_client_opts_mtx);
    return g_echo_args;
}

} // namespace client_opts

// Static auto-registration object
namespace {
    struct ClientOptsAutoReg {
        ClientOptsAutoReg() { client_opts::register_options(); }
    };
    [[maybe_unused]] static ClientOptsAutoReg s_client_auto_reg;
}
