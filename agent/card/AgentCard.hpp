/**
 * @file agent/card/AgentCard.hpp
 * @brief The agent's discovery manifest.
 */
#pragma once

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

namespace EchoAgent::Capabilities {
class CapabilityRegistry;
}

namespace EchoAgent::Card {

/// Identity fields, normally taken from the "agent" options section.
struct AgentIdentity {
    std::string agent_id{"echo-agent"};
    std::string name{"EchoAgent"};
    std::string description{"An echo agent that returns the same message it receives"};
    std::string version{"1.0.0"};
    std::string url{"http://localhost:8000"};
};

/// One advertised skill; mirrors a registered capability.
struct AgentSkill {
    std::string id;
    std::string name;
    std::string description;
    std::vector<std::string> input_modes;
    std::vector<std::string> output_modes;
    std::vector<std::string> examples;
    std::vector<std::string> tags;
};

/**
 * @brief Immutable agent card.
 *
 * Built once at startup from the identity and the capability registry, then
 * served verbatim by the discovery endpoint.
 */
class AgentCard {
public:
    static constexpr const char* ProtocolVersion = "0.3.0";

    AgentCard(AgentIdentity identity, std::vector<AgentSkill> skills);

    /**
     * @brief Build a card advertising every capability in @p registry, in registration order.
     */
    static AgentCard build(AgentIdentity identity, const Capabilities::CapabilityRegistry& registry);

    [[nodiscard]] const AgentIdentity& identity() const noexcept { return identity_; }
    [[nodiscard]] const std::vector<AgentSkill>& skills() const noexcept { return skills_; }
    [[nodiscard]] bool has_skill(const std::string& id) const;

    /// Discovery document (camelCase field names).
    [[nodiscard]] nlohmann::json to_json() const;

private:
    AgentIdentity identity_;
    std::vector<AgentSkill> skills_;
};

} // namespace EchoAgent::Card
