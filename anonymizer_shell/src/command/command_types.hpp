#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace sidecar::commands {

enum class CommandName {
    AnalyzeText,
    AnalyzeFile,
    AnalyzeBatch,
    GetSupportedExtensions,
};

/// Name the worker expects as its positional argument.
const char* wire_name(CommandName name);

/**
 * Detection and redaction settings forwarded verbatim to the worker.
 * Only the shape is checked here; the worker interprets the values.
 */
struct Preset {
    std::string preset_id;
    std::string name;
    int64_t layer = 1;
    int64_t minimum_confidence = 0;   // 0..100
    std::string uncertainty_policy;   // mask | redact | leave_intact | flag_only
    std::string pseudonym_style;      // neutral | realistic
    std::string language_mode;        // auto | fixed
    std::optional<std::string> language;
    std::map<std::string, bool> entities_enabled;

    std::optional<std::vector<std::string>> whitelist;
    std::optional<std::vector<std::string>> blacklist;
    std::optional<std::map<std::string, std::vector<std::string>>> language_whitelists;
    std::optional<std::map<std::string, std::vector<std::string>>> language_blacklists;

    bool operator==(const Preset& other) const;
    bool operator!=(const Preset& other) const { return !(*this == other); }
};

using CategoryCounts = std::map<std::string, uint64_t>;

struct AnalyzeTextArgs {
    std::string text;
    Preset preset;
    std::optional<std::string> model_path;
};

struct AnalyzeTextResult {
    std::string run_id;
    std::string run_folder;
    std::string redacted_text;
    CategoryCounts summary;
    uint64_t findings_count = 0;
    std::string language;
};

struct AnalyzeFileArgs {
    std::string input_path;
    Preset preset;
};

struct AnalyzeFileResult {
    std::string run_id;
    std::string run_folder;
    std::string output_path;
    CategoryCounts summary;
    uint64_t findings_count = 0;
};

struct AnalyzeBatchArgs {
    std::string input_folder;
    Preset preset;
    std::optional<std::string> language;
    bool recursive = true;
    std::optional<uint64_t> max_files;
    std::optional<std::string> runs_base;
};

struct AnalyzeBatchResult {
    std::string run_id;
    std::string run_folder;
    uint64_t processed_files = 0;
    uint64_t skipped_files = 0;
    uint64_t total_files_seen = 0;
    CategoryCounts summary;
    std::string output_folder;
};

struct GetSupportedExtensionsArgs {};

struct SupportedExtensions {
    std::vector<std::string> extensions;
};

} // namespace sidecar::commands
