/**
 * @file capabilities/builtins/EchoCapability.cpp
 * @brief Identity capability: the response is the input text.
 */

#include "BuiltinCapabilities.hpp"
#include "capabilities/handlers/ICapabilityHandler.hpp"
#include "capabilities/registry/CapabilityIds.hpp"
#include "capabilities/registry/CapabilityRegistry.hpp"

#include <memory>
#include <string>

namespace EchoAgent::Capabilities {
namespace {

/**
 * @brief Handler for the echo capability.
 *
 * Ignores its parameters and returns the text it was given.
 */
class EchoHandler : public ICapabilityHandler {
public:
    [[nodiscard]] const char* capability_name() const noexcept override {
        return CapabilityIds::Echo;
    }

    [[nodiscard]] std::string invoke(
        const std::string& text,
        const nlohmann::json& /*parameters*/
    ) const override {
        return text;
    }
};

} // anonymous namespace

void register_echo_capability(CapabilityRegistry& registry) {
    registry.register_capability(CapabilityDescriptor::create(
        std::make_unique<EchoHandler>(),
        "Echoes back the input message",
        {"Hello World!"},
        {"echo", "simple"}
    ));
}

} // namespace EchoAgent::Capabilities
