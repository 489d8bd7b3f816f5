/**
 * @file capabilities/registry/CapabilityRegistry.cpp
 * @brief Implementation of the CapabilityRegistry.
 */
#include "CapabilityRegistry.hpp"
#include "message/AgentErrors.hpp"
#include "logger.hpp"

#include <stdexcept>

namespace EchoAgent::Capabilities {

namespace {

/// Adapter that lets a plain std::function act as a handler.
class FunctionHandler : public ICapabilityHandler {
public:
    FunctionHandler(std::string name, CapabilityRegistry::Function fn)
        : name_(std::move(name)), fn_(std::move(fn)) {}

    [[nodiscard]] const char* capability_name() const noexcept override {
        return name_.c_str();
    }

    [[nodiscard]] std::string invoke(
        const std::string& text,
        const nlohmann::json& parameters
    ) const override {
        return fn_(text, parameters);
    }

private:
    std::string name_;
    CapabilityRegistry::Function fn_;
};

} // anonymous namespace

CapabilityRegistry::CapabilityRegistry(std::shared_ptr<Logger> logger)
    : logger_(std::move(logger))
{
}

void CapabilityRegistry::register_capability(CapabilityDescriptor descriptor) {
    if (!descriptor.handler) {
        throw std::invalid_argument("CapabilityRegistry: descriptor has no handler");
    }
    if (descriptor.name.empty()) {
        throw std::invalid_argument("CapabilityRegistry: capability name cannot be empty");
    }

    Entry entry;
    entry.info = CapabilityInfo{
        descriptor.name,
        std::move(descriptor.description),
        std::move(descriptor.input_modes),
        std::move(descriptor.output_modes),
        std::move(descriptor.examples),
        std::move(descriptor.tags)
    };
    entry.handler = std::shared_ptr<const ICapabilityHandler>(std::move(descriptor.handler));

    const std::string name = entry.info.name;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = index_.find(name);
        if (it != index_.end()) {
            entries_[it->second] = std::move(entry);
        } else {
            index_.emplace(name, entries_.size());
            entries_.push_back(std::move(entry));
        }
    }
    log_debug("Registered capability=" + name);
}

void CapabilityRegistry::register_function(const std::string& name, const std::string& description, Function fn) {
    if (!fn) {
        throw std::invalid_argument("CapabilityRegistry: function for '" + name + "' is empty");
    }
    register_capability(CapabilityDescriptor::create(
        std::make_unique<FunctionHandler>(name, std::move(fn)),
        description
    ));
}

bool CapabilityRegistry::has_capability(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return index_.find(name) != index_.end();
}

std::shared_ptr<const ICapabilityHandler> CapabilityRegistry::resolve(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = index_.find(name);
    if (it == index_.end()) {
        return nullptr;
    }
    return entries_[it->second].handler;
}

std::vector<CapabilityInfo> CapabilityRegistry::capabilities() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<CapabilityInfo> result;
    result.reserve(entries_.size());
    for (const auto& entry : entries_) {
        result.push_back(entry.info);
    }
    return result;
}

size_t CapabilityRegistry::capability_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

std::string CapabilityRegistry::invoke(
    const std::string& name,
    const std::string& task_id,
    const std::string& text,
    const nlohmann::json& parameters
) const {
    // Handle is copied under lock; the call itself runs unlocked
    auto handler = resolve(name);
    if (!handler) {
        log_debug("Unknown capability=" + name + " for task_id=" + task_id);
        throw UnknownCapability(name);
    }

    try {
        auto response = handler->invoke(text, parameters);
        log_debug("Processed capability=" + name + " task_id=" + task_id);
        return response;
    } catch (const CapabilityError& e) {
        log_debug("Failed capability=" + name + " task_id=" + task_id + ": " + e.what());
        throw;
    } catch (const std::exception& e) {
        log_debug("Failed capability=" + name + " task_id=" + task_id + ": " + e.what());
        throw CapabilityError(e.what());
    } catch (...) {
        log_debug("Failed capability=" + name + " task_id=" + task_id + ": non-standard exception");
        throw CapabilityError("capability raised a non-standard exception");
    }
}

void CapabilityRegistry::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.clear();
    index_.clear();
}

void CapabilityRegistry::set_logger(std::shared_ptr<Logger> logger) {
    std::lock_guard<std::mutex> lock(mutex_);
    logger_ = std::move(logger);
}

void CapabilityRegistry::log_debug(const std::string& message) const {
    std::shared_ptr<Logger> logger;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        logger = logger_;
    }
    if (logger) {
        logger->debug("[CapabilityRegistry] " + message);
    }
}

} // namespace EchoAgent::Capabilities
