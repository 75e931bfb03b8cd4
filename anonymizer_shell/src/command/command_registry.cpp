#include "command_registry.hpp"

#include <algorithm>

namespace sidecar::commands {

void CommandRegistry::add(std::unique_ptr<CommandHandler> handler) {
    if (!handler) {
        return;
    }
    handlers_.emplace(handler->name(), std::move(handler));
}

CommandHandler* CommandRegistry::find(const std::string& command) const {
    auto it = handlers_.find(command);
    if (it == handlers_.end()) {
        return nullptr;
    }
    return it->second.get();
}

std::vector<std::string> CommandRegistry::names() const {
    std::vector<std::string> result;
    result.reserve(handlers_.size());
    for (const auto& entry : handlers_) {
        result.push_back(entry.first);
    }
    std::sort(result.begin(), result.end());
    return result;
}

} // namespace sidecar::commands
