/**
 * @file capabilities/handlers/ICapabilityHandler.hpp
 * @brief Interface for capability handlers: pure text transforms.
 *
 * A capability turns the concatenated input text plus a JSON parameter
 * object into response text. Handlers hold no mutable state so the
 * registry may call them from many request threads at once.
 */
#pragma once

#include <nlohmann/json.hpp>

#include <string>

namespace EchoAgent::Capabilities {

/**
 * @brief Interface for capability handlers.
 *
 * Implement this interface to add a capability, then register it with
 * CapabilityRegistry::register_capability().
 */
class ICapabilityHandler {
public:
    virtual ~ICapabilityHandler() = default;

    /**
     * @brief Get the name this handler is registered under.
     * @return Capability name, as used on the wire and in the agent card.
     */
    [[nodiscard]] virtual const char* capability_name() const noexcept = 0;

    /**
     * @brief Compute the response text.
     *
     * @param text Concatenated text parts of the inbound message (may be empty).
     * @param parameters Capability parameters, always a JSON object.
     * @return The response text.
     * @throws CapabilityError if the parameters are unusable.
     */
    [[nodiscard]] virtual std::string invoke(
        const std::string& text,
        const nlohmann::json& parameters
    ) const = 0;
};

} // namespace EchoAgent::Capabilities
