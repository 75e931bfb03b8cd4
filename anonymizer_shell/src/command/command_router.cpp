#include "command_router.hpp"

#include "command_codec.hpp"
#include "../logger.hpp"

#include <utility>

#include <log4cplus/loggingmacros.h>

namespace sidecar::commands {

namespace {

std::string format_message(RouterErrorKind kind,
                           const std::string& command,
                           const std::string& message,
                           const Document& raw_document) {
    switch (kind) {
        case RouterErrorKind::EncodingFailure:
            return command + ": could not encode request: " + message;
        case RouterErrorKind::BridgeFailure:
            return command + ": " + message;
        case RouterErrorKind::DecodingFailure:
            return command + ": unexpected response shape: " + message +
                   ". response=" + raw_document.dump(-1, ' ', false, Document::error_handler_t::replace);
    }
    return command + ": " + message;
}

} // namespace

const char* to_string(RouterErrorKind kind) {
    switch (kind) {
        case RouterErrorKind::EncodingFailure:
            return "EncodingFailure";
        case RouterErrorKind::BridgeFailure:
            return "BridgeFailure";
        case RouterErrorKind::DecodingFailure:
            return "DecodingFailure";
    }
    return "Unknown";
}

RouterError::RouterError(RouterErrorKind kind,
                         std::string command,
                         const std::string& message,
                         std::optional<ErrorKind> bridge_kind,
                         Document raw_document)
    : std::runtime_error(format_message(kind, command, message, raw_document)),
      kind_(kind),
      command_(std::move(command)),
      bridge_kind_(bridge_kind),
      raw_document_(std::move(raw_document)) {}

CommandRouter::CommandRouter(const SidecarExecutor& executor)
    : executor_(executor) {}

template <typename Result, typename Args>
Result CommandRouter::invoke(CommandName name, const Args& args, const CancellationToken* cancel) const {
    const std::string command = wire_name(name);

    Document payload;
    try {
        payload = encode_request(args);
    } catch (const std::exception& exc) {
        LOG4CPLUS_ERROR(router_logger(), command << ": request encoding failed: " << exc.what());
        throw RouterError(RouterErrorKind::EncodingFailure, command, exc.what());
    }

    LOG4CPLUS_DEBUG(router_logger(), "Routing " << command);

    Document response;
    try {
        response = executor_.execute(command, payload, cancel);
    } catch (const SidecarError& exc) {
        throw RouterError(RouterErrorKind::BridgeFailure, command, exc.what(), exc.kind());
    }

    Result result;
    try {
        decode_response(response, result);
    } catch (const DecodeError& exc) {
        LOG4CPLUS_ERROR(router_logger(), command << ": " << exc.what() << " raw=" << response.dump(-1, ' ', false, Document::error_handler_t::replace));
        throw RouterError(RouterErrorKind::DecodingFailure, command, exc.what(), std::nullopt, std::move(response));
    }
    return result;
}

AnalyzeTextResult CommandRouter::analyze_text(const AnalyzeTextArgs& args, const CancellationToken* cancel) const {
    return invoke<AnalyzeTextResult>(CommandName::AnalyzeText, args, cancel);
}

AnalyzeFileResult CommandRouter::analyze_file(const AnalyzeFileArgs& args, const CancellationToken* cancel) const {
    return invoke<AnalyzeFileResult>(CommandName::AnalyzeFile, args, cancel);
}

AnalyzeBatchResult CommandRouter::analyze_batch(const AnalyzeBatchArgs& args, const CancellationToken* cancel) const {
    return invoke<AnalyzeBatchResult>(CommandName::AnalyzeBatch, args, cancel);
}

SupportedExtensions CommandRouter::get_supported_extensions(const CancellationToken* cancel) const {
    return invoke<SupportedExtensions>(CommandName::GetSupportedExtensions, GetSupportedExtensionsArgs{}, cancel);
}

} // namespace sidecar::commands
