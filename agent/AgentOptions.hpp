#pragma once

#include "agent/card/AgentCard.hpp"
#include "logger.hpp"

namespace agent_opts {

/**
 * \brief Register agent identity and logging options.
 *
 * JSON sections: "agent" {agent_id, name, description, version, url} and
 * "logging" {level}. Safe to call multiple times.
 */
void register_options();

/// Identity fields after config file and CLI flags were applied.
EchoAgent::Card::AgentIdentity get_identity();

/// Log threshold from --log-level / logging.level (default Info).
LogLevel get_log_level();

} // namespace agent_opts
