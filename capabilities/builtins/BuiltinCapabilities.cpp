/**
 * @file capabilities/builtins/BuiltinCapabilities.cpp
 */
#include "BuiltinCapabilities.hpp"

namespace EchoAgent::Capabilities {

void register_builtin_capabilities(CapabilityRegistry& registry) {
    register_echo_capability(registry);
    register_echo_with_prefix_capability(registry);
}

} // namespace EchoAgent::Capabilities
