#pragma once

#include "command_router.hpp"
#include "../document_codec.hpp"

#include <string>
#include <vector>

namespace sidecar::commands {

/**
 * Host entry point: run `command` with the host's argument document.
 *
 * Returns {"payload": <result>} on success, or {"payload": {}, "error":
 * {"message": <text>}} for any failure. Never throws for command failures.
 */
Document handle_command(const std::string& command,
                        const Document& host_args,
                        const CommandRouter& router,
                        const CancellationToken* cancel = nullptr);

/// Commands the host may invoke, sorted.
std::vector<std::string> available_commands();

} // namespace sidecar::commands
