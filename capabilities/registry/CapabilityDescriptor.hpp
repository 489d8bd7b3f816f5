/**
 * @file capabilities/registry/CapabilityDescriptor.hpp
 * @brief Complete capability definition: advertised metadata + handler.
 */
#pragma once

#include "capabilities/handlers/ICapabilityHandler.hpp"

#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace EchoAgent::Capabilities {

/**
 * @brief Complete capability definition: metadata and handler.
 *
 * The metadata fields are exactly what the agent card advertises for the
 * capability as a skill, so the card is always built from the registry.
 */
struct CapabilityDescriptor {
    std::string name;                          ///< Unique name; also the skill id
    std::string description;                   ///< Brief description of what the capability does
    std::vector<std::string> input_modes{"text"};
    std::vector<std::string> output_modes{"text"};
    std::vector<std::string> examples;         ///< Example inputs shown to callers
    std::vector<std::string> tags;
    std::unique_ptr<ICapabilityHandler> handler;

    CapabilityDescriptor() = default;
    CapabilityDescriptor(CapabilityDescriptor&&) = default;
    CapabilityDescriptor& operator=(CapabilityDescriptor&&) = default;

    // Non-copyable due to unique_ptr
    CapabilityDescriptor(const CapabilityDescriptor&) = delete;
    CapabilityDescriptor& operator=(const CapabilityDescriptor&) = delete;

    /**
     * @brief Convenience factory for text-in/text-out capabilities.
     *
     * @param handler The implementation (ownership transferred); its
     *                capability_name() becomes the descriptor name.
     * @param description What this capability does.
     * @param examples Example inputs.
     * @param tags Free-form tags for discovery.
     */
    static CapabilityDescriptor create(
        std::unique_ptr<ICapabilityHandler> handler,
        std::string description,
        std::vector<std::string> examples = {},
        std::vector<std::string> tags = {}
    ) {
        CapabilityDescriptor desc;
        desc.name = handler ? handler->capability_name() : "";
        desc.description = std::move(description);
        desc.examples = std::move(examples);
        desc.tags = std::move(tags);
        desc.handler = std::move(handler);
        return desc;
    }
};

/// Metadata-only view of a descriptor, safe to copy out of the registry.
struct CapabilityInfo {
    std::string name;
    std::string description;
    std::vector<std::string> input_modes;
    std::vector<std::string> output_modes;
    std::vector<std::string> examples;
    std::vector<std::string> tags;
};

} // namespace EchoAgent::Capabilities
