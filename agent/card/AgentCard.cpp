/**
 * @file agent/card/AgentCard.cpp
 */
#include "AgentCard.hpp"
#include "capabilities/registry/CapabilityRegistry.hpp"

#include <algorithm>
#include <utility>

namespace EchoAgent::Card {

AgentCard::AgentCard(AgentIdentity identity, std::vector<AgentSkill> skills)
    : identity_(std::move(identity))
    , skills_(std::move(skills))
{
}

AgentCard AgentCard::build(AgentIdentity identity, const Capabilities::CapabilityRegistry& registry) {
    std::vector<AgentSkill> skills;
    for (auto& info : registry.capabilities()) {
        AgentSkill skill;
        skill.id = info.name;
        skill.name = std::move(info.name);
        skill.description = std::move(info.description);
        skill.input_modes = std::move(info.input_modes);
        skill.output_modes = std::move(info.output_modes);
        skill.examples = std::move(info.examples);
        skill.tags = std::move(info.tags);
        skills.push_back(std::move(skill));
    }
    return AgentCard(std::move(identity), std::move(skills));
}

bool AgentCard::has_skill(const std::string& id) const {
    return std::any_of(skills_.begin(), skills_.end(),
                       [&id](const AgentSkill& skill) { return skill.id == id; });
}

nlohmann::json AgentCard::to_json() const {
    nlohmann::json skills = nlohmann::json::array();
    for (const auto& skill : skills_) {
        skills.push_back({
            {"id", skill.id},
            {"name", skill.name},
            {"description", skill.description},
            {"inputModes", skill.input_modes},
            {"outputModes", skill.output_modes},
            {"examples", skill.examples},
            {"tags", skill.tags}
        });
    }

    return {
        {"protocolVersion", ProtocolVersion},
        {"name", identity_.name},
        {"description", identity_.description},
        {"version", identity_.version},
        {"url", identity_.url},
        {"skills", skills},
        {"capabilities", {
            {"streaming", false},
            {"pushNotifications", false},
            {"stateTransitionHistory", false}
        }},
        {"defaultInputModes", nlohmann::json::array({"text"})},
        {"defaultOutputModes", nlohmann::json::array({"text"})}
    };
}

} // namespace EchoAgent::Card
