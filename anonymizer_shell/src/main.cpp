#include "command/command.hpp"
#include "command/command_router.hpp"
#include "logger.hpp"
#include "sidecar_bridge.hpp"
#include "sidecar_config.hpp"

#include <log4cplus/initializer.h>
#include <log4cplus/loggingmacros.h>

#include <cstring>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>

namespace {

void print_usage(const char* argv0) {
    std::cerr << "Usage: " << argv0
              << " [--config <sidecar.json>] [--log-config <log4cplus.ini>]"
                 " [--args <json> | --args-file <path>] <command>\n"
              << "Commands:";
    for (const auto& name : sidecar::commands::available_commands()) {
        std::cerr << ' ' << name;
    }
    std::cerr << std::endl;
}

bool read_file(const std::string& path, std::string& out) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return false;
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();
    out = buffer.str();
    return true;
}

} // namespace

int main(int argc, char** argv) {
    log4cplus::Initializer log_initializer;

    std::string config_path = "sidecar.json";
    std::string log_config_path = "log4cplus.ini";
    std::string args_text;
    std::string args_file;
    std::string command;

    for (int i = 1; i < argc; ++i) {
        if (strcmp(argv[i], "-v") == 0 || strcmp(argv[i], "--version") == 0) {
            std::cout << "Version: " << VERSION_STRING << std::endl;
            std::cout << "Commit: " << GIT_VERSION_STRING << std::endl;
            std::cout << "Build Time: " << BUILD_TIMESTAMP << std::endl;
            return 0;
        }

        if (strcmp(argv[i], "-h") == 0 || strcmp(argv[i], "--help") == 0) {
            print_usage(argv[0]);
            return 0;
        }

        if (strcmp(argv[i], "--config") == 0 && i + 1 < argc) {
            config_path = argv[++i];
            continue;
        }

        if (strncmp(argv[i], "--config=", 9) == 0) {
            config_path = argv[i] + 9;
            continue;
        }

        if (strcmp(argv[i], "--log-config") == 0 && i + 1 < argc) {
            log_config_path = argv[++i];
            continue;
        }

        if (strncmp(argv[i], "--log-config=", 13) == 0) {
            log_config_path = argv[i] + 13;
            continue;
        }

        if (strcmp(argv[i], "--args") == 0 && i + 1 < argc) {
            args_text = argv[++i];
            continue;
        }

        if (strncmp(argv[i], "--args=", 7) == 0) {
            args_text = argv[i] + 7;
            continue;
        }

        if (strcmp(argv[i], "--args-file") == 0 && i + 1 < argc) {
            args_file = argv[++i];
            continue;
        }

        if (strncmp(argv[i], "--args-file=", 12) == 0) {
            args_file = argv[i] + 12;
            continue;
        }

        if (argv[i][0] != '-' && command.empty()) {
            command = argv[i];
            continue;
        }

        std::cerr << "Unexpected argument: " << argv[i] << std::endl;
        print_usage(argv[0]);
        return 2;
    }

    if (command.empty() || (!args_text.empty() && !args_file.empty())) {
        print_usage(argv[0]);
        return 2;
    }

    init_logging(log_config_path);

    LOG4CPLUS_INFO(shell_logger(), "anonymizer_shell starting");
    LOG4CPLUS_INFO(shell_logger(), "Version: " << VERSION_STRING << ", Commit: " << GIT_VERSION_STRING);
    LOG4CPLUS_DEBUG(shell_logger(), "Build Time: " << BUILD_TIMESTAMP);

    if (!args_file.empty() && !read_file(args_file, args_text)) {
        LOG4CPLUS_ERROR(shell_logger(), "Cannot read arguments file: " << args_file);
        std::cerr << "Cannot read arguments file: " << args_file << std::endl;
        return 2;
    }

    sidecar::Document host_args;
    if (!args_text.empty()) {
        try {
            host_args = sidecar::Document::parse(args_text);
        } catch (const nlohmann::json::exception& exc) {
            LOG4CPLUS_ERROR(shell_logger(), "Invalid arguments JSON: " << exc.what());
            std::cerr << "Invalid arguments JSON: " << exc.what() << std::endl;
            return 2;
        }
    }

    sidecar::SidecarConfig config;
    try {
        config = sidecar::load_sidecar_config(config_path);
    } catch (const sidecar::ConfigError& exc) {
        LOG4CPLUS_ERROR(shell_logger(), exc.what());
        std::cerr << exc.what() << std::endl;
        return 2;
    }

    sidecar::SidecarBridge bridge(std::move(config));
    sidecar::commands::CommandRouter router(bridge);

    sidecar::Document response = sidecar::commands::handle_command(command, host_args, router);
    std::cout << response.dump(2, ' ', false, sidecar::Document::error_handler_t::replace) << std::endl;

    return response.contains("error") ? 1 : 0;
}
