/**
 * @file client/ClientCommands.hpp
 * @brief The client's subcommands, written against streams so they can be tested.
 */
#pragma once

#include "client/AgentClient.hpp"

#include <iosfwd>
#include <optional>
#include <string>

namespace EchoAgent::Client {

/// Exit codes shared by every subcommand.
namespace ExitCode {
    constexpr int Ok = 0;
    constexpr int Failed = 1;
    constexpr int Unreachable = 3;
}

/// Print name, description, version and skills of the agent.
int run_info(AgentClient& client, std::ostream& out);

/**
 * @brief Send one message and print "Response: <text>".
 *
 * @p prefix is only forwarded when @p capability is echo_with_prefix.
 */
int run_echo(AgentClient& client, const std::string& message, const std::string& capability,
             const std::optional<std::string>& prefix, std::ostream& out);

int run_health(AgentClient& client, std::ostream& out);

/**
 * @brief Read-eval-print loop.
 *
 * Commands: "quit", "info", "/prefix <text>" (switch to echo_with_prefix),
 * "/clear" (back to echo). Any other non-empty line is sent to the agent.
 * Ends on "quit" or end of input.
 */
class InteractiveShell {
public:
    InteractiveShell(AgentClient& client, std::istream& in, std::ostream& out);

    int run();

    /// Process one input line; returns false when the shell should exit.
    bool handle_line(const std::string& line);

    [[nodiscard]] const std::optional<std::string>& prefix() const noexcept { return prefix_; }

private:
    AgentClient& client_;
    std::istream& in_;
    std::ostream& out_;
    std::optional<std::string> prefix_;
};

} // namespace EchoAgent::Client
