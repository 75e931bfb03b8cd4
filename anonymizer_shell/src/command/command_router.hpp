#pragma once

#include "command_types.hpp"
#include "../document_codec.hpp"
#include "../sidecar_bridge.hpp"
#include "../sidecar_error.hpp"

#include <optional>
#include <stdexcept>
#include <string>

namespace sidecar::commands {

enum class RouterErrorKind {
    EncodingFailure,
    BridgeFailure,
    DecodingFailure,
};

const char* to_string(RouterErrorKind kind);

class RouterError : public std::runtime_error {
public:
    RouterError(RouterErrorKind kind,
                std::string command,
                const std::string& message,
                std::optional<ErrorKind> bridge_kind = std::nullopt,
                Document raw_document = Document());

    RouterErrorKind kind() const { return kind_; }
    const std::string& command() const { return command_; }

    /// Set for BridgeFailure only.
    const std::optional<ErrorKind>& bridge_kind() const { return bridge_kind_; }

    /// The offending success document, for DecodingFailure only.
    const Document& raw_document() const { return raw_document_; }

private:
    RouterErrorKind kind_;
    std::string command_;
    std::optional<ErrorKind> bridge_kind_;
    Document raw_document_;
};

/**
 * Typed host operations mapped onto generic sidecar calls.
 *
 * Every operation either returns a fully populated result or throws RouterError.
 */
class CommandRouter {
public:
    explicit CommandRouter(const SidecarExecutor& executor);

    AnalyzeTextResult analyze_text(const AnalyzeTextArgs& args, const CancellationToken* cancel = nullptr) const;
    AnalyzeFileResult analyze_file(const AnalyzeFileArgs& args, const CancellationToken* cancel = nullptr) const;
    AnalyzeBatchResult analyze_batch(const AnalyzeBatchArgs& args, const CancellationToken* cancel = nullptr) const;
    SupportedExtensions get_supported_extensions(const CancellationToken* cancel = nullptr) const;

private:
    template <typename Result, typename Args>
    Result invoke(CommandName name, const Args& args, const CancellationToken* cancel) const;

    const SidecarExecutor& executor_;
};

} // namespace sidecar::commands
