// HttpServerOptions.cpp - HTTP listener options provider with auto-registration
#include <optional>
#include "options/Options.hpp"
#include <mutex>
#include <atomic>

namespace {
    std::mutex g_http_opts_mtx;
    std::optional<std::string> g_http_host;
    std::optional<int> g_http_port;
    std::atomic<bool> g_http_registered{false};
}

// Listener options live alongside the server implementation
namespace http_server_opts {

void register_options() {
    bool expected = false;
    if (!g_http_registered.compare_exchange_strong(expected, true)) {
        return; // already registered
    }
    shared_opts::Options::add_provider([](CLI::App& app, const nlohmann::json& j){
        std::string host_default = "0.0.0.0";
        int port_default = 8000;

        if (j.contains("server") && j["server"].is_object()) {
            const auto& sj = j["server"];
            shared_opts::read_config_string(sj, "host", host_default);
            shared_opts::read_config_int(sj, "port", 1, 65535, port_default);
        }

        {
            std::lock_guard<std::mutex> lk(g_http_opts_mtx);
            g_http_host = host_default;
            g_http_port = port_default;
        }

        app.add_option("--host", g_http_host, "HTTP listen host (default 0.0.0.0)")->group("Server");
        app.add_option("--port", g_http_port, "HTTP listen port (default 8000)")
            ->check(CLI::Range(1, 65535))
            ->group("Server");
    });
}

std::optional<std::string> get_listen_host() {
    std::lock_guard<std::mutex> lk(g_http_opts_mtx);
    return g_http_host;
}

std::optional<int> get_listen_port() {
    std::lock_guard<std::mutex> lk(g_http_opts_mtx);
    return g_http_port;
}

} // namespace http_server_opts

// Static auto-registration object
namespace {
    struct HttpServerOptsAutoReg {
        HttpServerOptsAutoReg() { http_server_opts::register_options(); }
    } http_server_opts_auto_reg_instance; // NOLINT(cert-err58-cpp)
}
