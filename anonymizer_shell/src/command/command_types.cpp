#include "command_types.hpp"

namespace sidecar::commands {

const char* wire_name(CommandName name) {
    switch (name) {
        case CommandName::AnalyzeText:
            return "analyze_text";
        case CommandName::AnalyzeFile:
            return "analyze_file";
        case CommandName::AnalyzeBatch:
            return "analyze_batch";
        case CommandName::GetSupportedExtensions:
            return "get_supported_extensions";
    }
    return "";
}

bool Preset::operator==(const Preset& other) const {
    return preset_id == other.preset_id &&
           name == other.name &&
           layer == other.layer &&
           minimum_confidence == other.minimum_confidence &&
           uncertainty_policy == other.uncertainty_policy &&
           pseudonym_style == other.pseudonym_style &&
           language_mode == other.language_mode &&
           language == other.language &&
           entities_enabled == other.entities_enabled &&
           whitelist == other.whitelist &&
           blacklist == other.blacklist &&
           language_whitelists == other.language_whitelists &&
           language_blacklists == other.language_blacklists;
}

} // namespace sidecar::commands
