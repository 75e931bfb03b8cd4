#include "command.hpp"

#include "command_base.hpp"
#include "command_codec.hpp"
#include "command_registry.hpp"
#include "../logger.hpp"

#include <log4cplus/loggingmacros.h>

namespace sidecar::commands {

namespace {

const CommandRegistry& get_registry() {
	static const CommandRegistry registry = [] {
		CommandRegistry reg;
		register_analysis_commands(reg);
		register_discovery_commands(reg);
		return reg;
	}();

	return registry;
}

Document error_response(const std::string& message) {
	Document response = Document::object();
	response["payload"] = Document::object();
	response["error"] = Document::object();
	response["error"]["message"] = message;
	return response;
}

} // namespace

const Document& CommandHandler::ensure_args_map(const CommandContext& ctx) const {
	if (!ctx.args.is_object()) {
		LOG4CPLUS_ERROR(router_logger(), ctx.command << " missing arguments");
		throw DecodeError("Missing arguments");
	}
	return ctx.args;
}

Document handle_command(const std::string& command,
                        const Document& host_args,
                        const CommandRouter& router,
                        const CancellationToken* cancel) {
	LOG4CPLUS_INFO(router_logger(), "Host command: " << command);

	CommandHandler* handler = get_registry().find(command);
	if (!handler) {
		LOG4CPLUS_WARN(router_logger(), "Unknown command: " << command);
		return error_response("Unknown command: " + command);
	}

	CommandContext ctx{command, router, host_args, cancel};
	try {
		Document response = Document::object();
		response["payload"] = handler->handle(ctx);
		return response;
	} catch (const RouterError& exc) {
		// Already logged where it was classified.
		return error_response(exc.what());
	} catch (const DecodeError& exc) {
		LOG4CPLUS_WARN(router_logger(), command << ": invalid arguments: " << exc.what());
		return error_response(std::string("Invalid arguments: ") + exc.what());
	} catch (const std::exception& exc) {
		LOG4CPLUS_ERROR(router_logger(), command << ": " << exc.what());
		return error_response(exc.what());
	}
}

std::vector<std::string> available_commands() {
	return get_registry().names();
}

} // namespace sidecar::commands
