/**
 * @file capabilities/registry/CapabilityRegistry.hpp
 * @brief Registry of capabilities: metadata, handlers, and dispatch.
 *
 * Constructed once at startup and passed explicitly to the executor and
 * the agent card builder.
 */
#pragma once

#include "CapabilityDescriptor.hpp"

#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

class Logger;

namespace EchoAgent::Capabilities {

/**
 * @brief Registry mapping capability names to handlers.
 *
 * Thread-safe. Registration order is preserved so the agent card lists
 * skills in a stable order. Used by:
 * - TaskExecutor: resolve and invoke the requested capability
 * - AgentCard: advertise every registered capability as a skill
 */
class CapabilityRegistry {
public:
    /// Plain function form of a capability: (text, parameters) -> response text.
    using Function = std::function<std::string(const std::string&, const nlohmann::json&)>;

    /**
     * @brief Construct an empty registry.
     * @param logger Logger for debug output (may be nullptr).
     *
     * Call register_builtin_capabilities() (BuiltinCapabilities.hpp) to add
     * echo and echo_with_prefix.
     */
    explicit CapabilityRegistry(std::shared_ptr<Logger> logger = nullptr);

    // Non-copyable, non-movable
    CapabilityRegistry(const CapabilityRegistry&) = delete;
    CapabilityRegistry& operator=(const CapabilityRegistry&) = delete;
    CapabilityRegistry(CapabilityRegistry&&) = delete;
    CapabilityRegistry& operator=(CapabilityRegistry&&) = delete;

    // =========================================================================
    // Registration
    // =========================================================================

    /**
     * @brief Register a capability with its handler.
     * @param descriptor Complete capability definition (takes ownership of handler).
     * @throws std::invalid_argument if the handler is null or the name is empty.
     * @note If a capability with the same name exists, it is replaced in place.
     */
    void register_capability(CapabilityDescriptor descriptor);

    /**
     * @brief Register a plain function as a capability.
     * @param name Capability name.
     * @param description Advertised description.
     * @param fn The transform; may throw CapabilityError.
     */
    void register_function(const std::string& name, const std::string& description, Function fn);

    // =========================================================================
    // Query
    // =========================================================================

    [[nodiscard]] bool has_capability(const std::string& name) const;

    /**
     * @brief Look up a handler by name.
     * @return Shared handle to the handler, or nullptr if not registered.
     */
    [[nodiscard]] std::shared_ptr<const ICapabilityHandler> resolve(const std::string& name) const;

    /// Metadata of all registered capabilities, in registration order.
    [[nodiscard]] std::vector<CapabilityInfo> capabilities() const;

    [[nodiscard]] size_t capability_count() const;

    // =========================================================================
    // Dispatch
    // =========================================================================

    /**
     * @brief Resolve and invoke a capability.
     *
     * @param name Capability name.
     * @param task_id Task identifier (for logging).
     * @param text Input text.
     * @param parameters Capability parameters (JSON object).
     * @return Response text.
     * @throws UnknownCapability if @p name is not registered.
     * @throws CapabilityError if the handler fails for any reason, including
     *         exceptions not derived from std::exception.
     */
    [[nodiscard]] std::string invoke(
        const std::string& name,
        const std::string& task_id,
        const std::string& text,
        const nlohmann::json& parameters
    ) const;

    /**
     * @brief Remove all registered capabilities (primarily for testing).
     */
    void clear();

    void set_logger(std::shared_ptr<Logger> logger);

private:
    struct Entry {
        CapabilityInfo info;
        std::shared_ptr<const ICapabilityHandler> handler;
    };

    void log_debug(const std::string& message) const;

    std::shared_ptr<Logger> logger_;
    mutable std::mutex mutex_;
    std::vector<Entry> entries_;
    std::unordered_map<std::string, size_t> index_;
};

} // namespace EchoAgent::Capabilities
