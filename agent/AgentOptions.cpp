// AgentOptions.cpp - Agent identity and logging options provider with auto-registration
#include "AgentOptions.hpp"
#include "options/Options.hpp"

#include <atomic>
#include <mutex>
#include <string>

namespace {
    std::mutex g_agent_opts_mtx;
    EchoAgent::Card::AgentIdentity g_identity;
    std::string g_log_level = "info";
    std::atomic<bool> g_agent_registered{false};
}

namespace agent_opts {

void register_options() {
    bool expected = false;
    if (!g_agent_registered.compare_exchange_strong(expected, true)) {
        return; // already registered
    }

    shared_opts::Options::add_provider([](CLI::App& app, const nlohmann::json& j){
        EchoAgent::Card::AgentIdentity identity;
        std::string level = "info";

        if (j.contains("agent") && j["agent"].is_object()) {
            const auto& aj = j["agent"];
            shared_opts::read_config_string(aj, "agent_id", identity.agent_id);
            shared_opts::read_config_string(aj, "name", identity.name);
            shared_opts::read_config_string(aj, "description", identity.description);
            shared_opts::read_config_string(aj, "version", identity.version);
            shared_opts::read_config_string(aj, "url", identity.url);
        }
        if (j.contains("logging") && j["logging"].is_object()) {
            shared_opts::read_config_string(j["logging"], "level", level);
        }

        {
            std::lock_guard<std::mutex> lk(g_agent_opts_mtx);
            g_identity = identity;
            g_log_level = level;
        }

        app.add_option("--agent-id", g_identity.agent_id, "Agent identifier")->group("Agent");
        app.add_option("--agent-name", g_identity.name, "Agent name advertised in the agent card")->group("Agent");
        app.add_option("--agent-description", g_identity.description, "Agent description")->group("Agent");
        app.add_option("--agent-version", g_identity.version, "Agent version")->group("Agent");
        app.add_option("--agent-url", g_identity.url, "Public URL advertised in the agent card")->group("Agent");
        app.add_option("--log-level", g_log_level, "Log level (debug, info, warning, error, critical)")
            ->check(CLI::IsMember({"debug", "info", "warning", "warn", "error", "critical"}, CLI::ignore_case))
            ->group("Logging");
    });
}

EchoAgent::Card::AgentIdentity get_identity() {
    std::lock_guard<std::mutex> lk(g_agent_opts_mtx);
    return g_identity;
}

LogLevel get_log_level() {
    std::lock_guard<std::mutex> lk(g_agent_opts_mtx);
    return parse_log_level(g_log_level).value_or(LogLevel::Info);
}

} // namespace agent_opts

// Static auto-registration object
namespace {
    struct AgentOptsAutoReg {
        AgentOptsAutoReg() { agent_opts::register_options(); }
    };
    [[maybe_unused]] static AgentOptsAutoReg s_agent_auto_reg;
}
