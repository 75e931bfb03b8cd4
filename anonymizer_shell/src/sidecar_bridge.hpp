#pragma once

#include "document_codec.hpp"
#include "process_runner.hpp"
#include "sidecar_config.hpp"

#include <string>

namespace sidecar {

class CancellationToken;

/// Seam between the command router and whatever runs worker commands.
class SidecarExecutor {
public:
    virtual ~SidecarExecutor() = default;

    /**
     * Run one worker command and return its response envelope.
     * @throws SidecarError on any failure; there are no partial results.
     */
    virtual Document execute(const std::string& command,
                             const Document& payload,
                             const CancellationToken* cancel = nullptr) const = 0;
};

/**
 * One worker process per call over stdin/stdout.
 *
 * Holds only immutable configuration, so one instance may serve concurrent
 * calls from several threads.
 */
class SidecarBridge final : public SidecarExecutor {
public:
    explicit SidecarBridge(SidecarConfig config);

    Document execute(const std::string& command,
                     const Document& payload,
                     const CancellationToken* cancel = nullptr) const override;

    const SidecarConfig& config() const { return config_; }

private:
    SidecarConfig config_;
};

/// Launch description for `command`: prefix args, then the command name.
ProcessSpec build_process_spec(const SidecarConfig& config, const std::string& command);

/**
 * Turn a finished process into a response envelope.
 *
 * Exit status is checked first (stdout is ignored on failure), then the output is
 * parsed, then the "error" field is checked. The first failing stage throws.
 */
Document classify_outcome(const ProcessOutcome& outcome, codec::WireFormat format);

/// Text of a worker "error" field: strings verbatim, anything else serialized.
std::string describe_error_field(const Document& value);

} // namespace sidecar
