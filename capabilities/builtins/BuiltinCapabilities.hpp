/**
 * @file capabilities/builtins/BuiltinCapabilities.hpp
 * @brief Registration entry points for the built-in capabilities.
 */
#pragma once

namespace EchoAgent::Capabilities {

class CapabilityRegistry;

/// Register "echo": returns the input text unchanged.
void register_echo_capability(CapabilityRegistry& registry);

/// Register "echo_with_prefix": returns parameters.prefix (default "Echo: ") + text.
void register_echo_with_prefix_capability(CapabilityRegistry& registry);

/**
 * @brief Register every built-in capability, in the order the agent card lists them.
 */
void register_builtin_capabilities(CapabilityRegistry& registry);

} // namespace EchoAgent::Capabilities
