/**
 * @file message/AgentErrors.hpp
 * @brief Exception taxonomy shared by the agent server and client.
 */
#pragma once

#include "options/Options.hpp"

#include <stdexcept>
#include <string>

namespace EchoAgent {

/// Malformed or missing configuration (fatal at startup).
using ConfigError = shared_opts::ConfigError;

/// Inbound JSON does not describe a valid protocol object.
class ProtocolError : public std::invalid_argument {
public:
    explicit ProtocolError(const std::string& what) : std::invalid_argument(what) {}
};

/// Requested capability is not registered.
class UnknownCapability : public std::runtime_error {
public:
    explicit UnknownCapability(const std::string& name)
        : std::runtime_error("Unknown capability: " + name), name_(name) {}

    [[nodiscard]] const std::string& name() const noexcept { return name_; }

private:
    std::string name_;
};

/// A capability function failed while producing its output.
class CapabilityError : public std::runtime_error {
public:
    explicit CapabilityError(const std::string& detail) : std::runtime_error(detail) {}
};

/// Operation on a task that already reached a terminal state.
class AlreadyTerminalError : public std::runtime_error {
public:
    explicit AlreadyTerminalError(const std::string& task_id)
        : std::runtime_error("Task " + task_id + " is already in a terminal state") {}
};

/// Two drivers competing for the same task id.
class TaskConflictError : public std::runtime_error {
public:
    explicit TaskConflictError(const std::string& what) : std::runtime_error(what) {}
};

class TaskNotFoundError : public std::runtime_error {
public:
    explicit TaskNotFoundError(const std::string& task_id)
        : std::runtime_error("Task not found: " + task_id) {}
};

/// Client side: the server could not be reached or answered with an HTTP error.
class TransportError : public std::runtime_error {
public:
    explicit TransportError(const std::string& what, int http_status = 0)
        : std::runtime_error(what), http_status_(http_status) {}

    /// HTTP status code, or 0 when no response was received.
    [[nodiscard]] int http_status() const noexcept { return http_status_; }

private:
    int http_status_;
};

} // namespace EchoAgent
