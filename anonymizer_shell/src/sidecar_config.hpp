#pragma once

#include "document_codec.hpp"

#include <chrono>
#include <cstdint>
#include <limits>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace sidecar {

/// Default worker location; resolved by the child relative to its working directory.
inline constexpr const char* kDefaultWorkerProgram = "engine/anonymizer_sidecar";

/// Largest accepted timeout_ms (about 24.8 days).
inline constexpr uint64_t kMaxTimeoutMs = static_cast<uint64_t>(std::numeric_limits<int>::max());

struct SidecarConfig {
    std::string program = kDefaultWorkerProgram;
    std::vector<std::string> args;  // placed before the command name
    std::string working_directory;
    std::vector<std::pair<std::string, std::string>> env;
    std::chrono::milliseconds timeout{0};
    codec::WireFormat wire_format = codec::WireFormat::Json;
    bool kill_on_parent_death = true;
};

class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * Load sidecar settings from a JSON file.
 *
 * A missing file yields the defaults. Malformed JSON or a key of the wrong type
 * throws ConfigError naming the file. Unknown keys are logged and ignored.
 */
SidecarConfig load_sidecar_config(const std::string& path);

SidecarConfig sidecar_config_from_json(const nlohmann::json& doc, const std::string& origin);

} // namespace sidecar
