#pragma once

#include "command_router.hpp"
#include "../document_codec.hpp"

#include <string>

namespace sidecar::commands {

struct CommandContext {
	const std::string& command;
	const CommandRouter& router;
	const Document& args;
	const CancellationToken* cancel;
};

class CommandHandler {
public:
	virtual ~CommandHandler() = default;
	virtual const char* name() const = 0;

	/// Returns the result document for the host. Failures are thrown.
	virtual Document handle(const CommandContext& ctx) = 0;

protected:
	/// Throws DecodeError("Missing arguments") unless the host sent an object.
	const Document& ensure_args_map(const CommandContext& ctx) const;
};

} // namespace sidecar::commands
