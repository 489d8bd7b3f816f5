/**
 * @file capabilities/builtins/EchoWithPrefixCapability.cpp
 * @brief Echo capability that prepends a configurable prefix.
 */

#include "BuiltinCapabilities.hpp"
#include "capabilities/handlers/ICapabilityHandler.hpp"
#include "capabilities/registry/CapabilityIds.hpp"
#include "capabilities/registry/CapabilityRegistry.hpp"
#include "message/AgentErrors.hpp"

#include <memory>
#include <string>

namespace EchoAgent::Capabilities {
namespace {

/**
 * @brief Handler for the echo_with_prefix capability.
 *
 * Parameters:
 * - "prefix" (string, optional): text placed before the echo. Defaults to
 *   CapabilityIds::DefaultPrefix.
 */
class EchoWithPrefixHandler : public ICapabilityHandler {
public:
    [[nodiscard]] const char* capability_name() const noexcept override {
        return CapabilityIds::EchoWithPrefix;
    }

    [[nodiscard]] std::string invoke(
        const std::string& text,
        const nlohmann::json& parameters
    ) const override {
        std::string prefix = CapabilityIds::DefaultPrefix;
        if (parameters.is_object()) {
            auto it = parameters.find("prefix");
            if (it != parameters.end() && !it->is_null()) {
                if (!it->is_string()) {
                    throw CapabilityError("Parameter 'prefix' must be a string");
                }
                prefix = it->get<std::string>();
            }
        }
        return prefix + text;
    }
};

} // anonymous namespace

void register_echo_with_prefix_capability(CapabilityRegistry& registry) {
    registry.register_capability(CapabilityDescriptor::create(
        std::make_unique<EchoWithPrefixHandler>(),
        "Echoes back the input message with a prefix",
        {"Hello World! with prefix"},
        {"echo", "prefix"}
    ));
}

} // namespace EchoAgent::Capabilities
