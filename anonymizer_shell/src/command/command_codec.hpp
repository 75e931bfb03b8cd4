#pragma once

#include "command_types.hpp"
#include "../document_codec.hpp"

#include <stdexcept>

namespace sidecar::commands {

/// A document did not have the shape a command expects.
class DecodeError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Worker requests. Field names are the worker contract.
Document encode_preset(const Preset& preset);
Document encode_request(const AnalyzeTextArgs& args);
Document encode_request(const AnalyzeFileArgs& args);
Document encode_request(const AnalyzeBatchArgs& args);
Document encode_request(const GetSupportedExtensionsArgs& args);

// Worker responses. Missing, mistyped and unexpected fields throw DecodeError.
Preset decode_preset(const Document& doc);
void decode_response(const Document& doc, AnalyzeTextResult& out);
void decode_response(const Document& doc, AnalyzeFileResult& out);
void decode_response(const Document& doc, AnalyzeBatchResult& out);
void decode_response(const Document& doc, SupportedExtensions& out);

// Host arguments (camelCase, as sent by the desktop front end).
AnalyzeTextArgs decode_analyze_text_args(const Document& host_args);
AnalyzeFileArgs decode_analyze_file_args(const Document& host_args);
AnalyzeBatchArgs decode_analyze_batch_args(const Document& host_args);

// Results handed back to the host, in the worker's field names.
Document to_document(const AnalyzeTextResult& result);
Document to_document(const AnalyzeFileResult& result);
Document to_document(const AnalyzeBatchResult& result);
Document to_document(const SupportedExtensions& result);

} // namespace sidecar::commands
