#pragma once

#include "command_base.hpp"

#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace sidecar::commands {

class CommandRegistry {
public:
    void add(std::unique_ptr<CommandHandler> handler);
    CommandHandler* find(const std::string& command) const;
    std::vector<std::string> names() const;

private:
    std::unordered_map<std::string, std::unique_ptr<CommandHandler>> handlers_;
};

void register_analysis_commands(CommandRegistry& registry);
void register_discovery_commands(CommandRegistry& registry);

} // namespace sidecar::commands
