#include "sidecar_config.hpp"
#include "logger.hpp"

#include <filesystem>
#include <fstream>

#include <log4cplus/loggingmacros.h>

namespace sidecar {

namespace {

[[noreturn]] void fail(const std::string& origin, const std::string& what) {
    throw ConfigError(origin + ": " + what);
}

std::string require_string(const nlohmann::json& value, const std::string& key, const std::string& origin) {
    if (!value.is_string()) {
        fail(origin, "'" + key + "' must be a string");
    }
    return value.get<std::string>();
}

} // namespace

SidecarConfig sidecar_config_from_json(const nlohmann::json& doc, const std::string& origin) {
    if (!doc.is_object()) {
        fail(origin, "top-level value must be an object");
    }

    SidecarConfig config;
    for (const auto& [key, value] : doc.items()) {
        if (key == "program") {
            config.program = require_string(value, key, origin);
            if (config.program.empty()) {
                fail(origin, "'program' must not be empty");
            }
        } else if (key == "args") {
            if (!value.is_array()) {
                fail(origin, "'args' must be an array of strings");
            }
            for (const auto& arg : value) {
                config.args.push_back(require_string(arg, "args[]", origin));
            }
        } else if (key == "working_directory") {
            config.working_directory = require_string(value, key, origin);
        } else if (key == "env") {
            if (!value.is_object()) {
                fail(origin, "'env' must be an object of strings");
            }
            for (const auto& [name, setting] : value.items()) {
                config.env.emplace_back(name, require_string(setting, "env." + name, origin));
            }
        } else if (key == "timeout_ms") {
            if (!value.is_number_unsigned()) {
                fail(origin, "'timeout_ms' must be a non-negative integer");
            }
            if (value.get<uint64_t>() > kMaxTimeoutMs) {
                fail(origin, "'timeout_ms' must not exceed " + std::to_string(kMaxTimeoutMs));
            }
            config.timeout = std::chrono::milliseconds(value.get<uint64_t>());
        } else if (key == "wire_format") {
            try {
                config.wire_format = codec::parse_wire_format(require_string(value, key, origin));
            } catch (const codec::CodecError& exc) {
                fail(origin, exc.what());
            }
        } else if (key == "kill_on_parent_death") {
            if (!value.is_boolean()) {
                fail(origin, "'kill_on_parent_death' must be a boolean");
            }
            config.kill_on_parent_death = value.get<bool>();
        } else {
            LOG4CPLUS_WARN(shell_logger(), origin << ": ignoring unknown key '" << key << "'");
        }
    }
    return config;
}

SidecarConfig load_sidecar_config(const std::string& path) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        LOG4CPLUS_INFO(shell_logger(), "Sidecar config " << path << " not found, using defaults");
        return SidecarConfig{};
    }

    std::ifstream input(path);
    if (!input) {
        throw ConfigError(path + ": cannot open file");
    }

    nlohmann::json doc;
    try {
        doc = nlohmann::json::parse(input);
    } catch (const nlohmann::json::exception& exc) {
        throw ConfigError(path + ": " + exc.what());
    }

    SidecarConfig config = sidecar_config_from_json(doc, path);
    LOG4CPLUS_INFO(shell_logger(), "Sidecar config loaded from " << path << ": program=" << config.program
                                   << " wire_format=" << codec::to_string(config.wire_format)
                                   << " timeout_ms=" << config.timeout.count());
    return config;
}

} // namespace sidecar
