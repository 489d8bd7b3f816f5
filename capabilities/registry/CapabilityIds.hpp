/**
 * @file capabilities/registry/CapabilityIds.hpp
 * @brief Compile-time names of the built-in capabilities.
 *
 * Central location for capability names keeps the handlers, the agent
 * card and the client in agreement.
 */
#pragma once

namespace EchoAgent::Capabilities {

namespace CapabilityIds {
    /// Identity transform (EchoHandler)
    constexpr const char* Echo = "echo";

    /// Identity transform with a configurable prefix (EchoWithPrefixHandler)
    constexpr const char* EchoWithPrefix = "echo_with_prefix";

    /// Capability used when a request does not name one
    constexpr const char* Default = Echo;

    /// Prefix applied by echo_with_prefix when no "prefix" parameter is given
    constexpr const char* DefaultPrefix = "Echo: ";
}

} // namespace EchoAgent::Capabilities
