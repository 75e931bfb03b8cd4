#include "command_base.hpp"
#include "command_codec.hpp"
#include "command_registry.hpp"

#include <memory>

namespace sidecar::commands {

namespace {

class GetSupportedExtensionsCommand final : public CommandHandler {
public:
    const char* name() const override { return "get_supported_extensions"; }

    // Takes no arguments; the host may send nothing or an empty object.
    Document handle(const CommandContext& ctx) override {
        if (!ctx.args.is_null() && !(ctx.args.is_object() && ctx.args.empty())) {
            throw DecodeError("get_supported_extensions takes no arguments");
        }
        return to_document(ctx.router.get_supported_extensions(ctx.cancel));
    }
};

} // namespace

void register_discovery_commands(CommandRegistry& registry) {
    registry.add(std::make_unique<GetSupportedExtensionsCommand>());
}

} // namespace sidecar::commands
