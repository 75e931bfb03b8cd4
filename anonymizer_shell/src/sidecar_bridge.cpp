#include "sidecar_bridge.hpp"

#include "cancellation_token.hpp"
#include "logger.hpp"
#include "sidecar_error.hpp"

#include <utility>

#include <log4cplus/loggingmacros.h>

namespace sidecar {

SidecarBridge::SidecarBridge(SidecarConfig config)
    : config_(std::move(config)) {}

ProcessSpec build_process_spec(const SidecarConfig& config, const std::string& command) {
    ProcessSpec spec;
    spec.program = config.program;
    spec.args = config.args;
    spec.args.push_back(command);
    spec.working_directory = config.working_directory;
    spec.env = config.env;
    spec.kill_on_parent_death = config.kill_on_parent_death;
    return spec;
}

std::string describe_error_field(const Document& value) {
    if (value.is_string()) {
        return value.get<std::string>();
    }
    return value.dump(-1, ' ', false, Document::error_handler_t::replace);
}

Document classify_outcome(const ProcessOutcome& outcome, codec::WireFormat format) {
    if (!outcome.success()) {
        std::string detail = outcome.stderr_data;
        if (!outcome.exited_normally() && detail.empty()) {
            detail = "worker terminated by signal " + std::to_string(outcome.term_signal);
        }
        throw SidecarError(ErrorKind::WorkerReportedFailure, std::move(detail));
    }

    Document response;
    try {
        response = codec::decode(outcome.stdout_data, format);
    } catch (const codec::CodecError& exc) {
        throw SidecarError(ErrorKind::InvalidOutput, exc.what(), outcome.stdout_data);
    }

    if (const Document* error = codec::find_key(response, "error")) {
        throw SidecarError(ErrorKind::WorkerReportedFailure, describe_error_field(*error));
    }

    return response;
}

Document SidecarBridge::execute(const std::string& command,
                                const Document& payload,
                                const CancellationToken* cancel) const {
    if (command.empty()) {
        LOG4CPLUS_ERROR(bridge_logger(), "Rejected sidecar call with empty command name");
        throw SidecarError(ErrorKind::InvalidPayload, "command name is empty");
    }

    std::string request;
    try {
        request = codec::encode(payload, config_.wire_format);
    } catch (const codec::CodecError& exc) {
        LOG4CPLUS_ERROR(bridge_logger(), command << ": payload encode failed: " << exc.what());
        throw SidecarError(ErrorKind::InvalidPayload, exc.what());
    }

    LOG4CPLUS_INFO(bridge_logger(), "Sidecar command: " << command << " program=" << config_.program
                                    << " request=" << request.size() << "B ("
                                    << codec::to_string(config_.wire_format) << ")");

    try {
        RunLimits limits;
        limits.timeout = config_.timeout;
        limits.cancel = cancel;
        ProcessOutcome outcome = run_process(build_process_spec(config_, command), request, limits);

        if (outcome.success() && !outcome.stderr_data.empty()) {
            LOG4CPLUS_DEBUG(bridge_logger(), command << " stderr: " << outcome.stderr_data);
        }

        Document response = classify_outcome(outcome, config_.wire_format);
        LOG4CPLUS_INFO(bridge_logger(), "Sidecar command " << command << " completed");
        return response;
    } catch (const SidecarError& exc) {
        LOG4CPLUS_WARN(bridge_logger(), "Sidecar command " << command << " failed ["
                                        << to_string(exc.kind()) << "]: " << exc.what());
        throw;
    }
}

} // namespace sidecar
