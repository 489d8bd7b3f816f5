#pragma once

#include "logger.hpp"

#include <optional>
#include <string>

namespace client_opts {

/// Subcommand selected on the command line.
enum class Command { None, Info, Echo, Interactive, Health };

struct EchoArgs {
    std::string message;
    std::string capability{"echo"};
    std::optional<std::string> prefix;
};

/**
 * \brief Register client options and subcommands.
 *
 * JSON sections: "server" {url}, "client" {timeout_seconds}, "logging" {level}.
 * Subcommands: info, echo <message> [--capability] [--prefix], interactive, health.
 * Safe to call multiple times.
 */
void register_options();

std::string get_server_url();
int get_timeout_seconds();
LogLevel get_log_level();
Command get_command();
EchoArgs get_echo_args();

} // namespace client_opts
