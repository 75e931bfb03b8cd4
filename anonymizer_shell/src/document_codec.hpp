#pragma once

#include <msgpack.hpp>
#include <nlohmann/json.hpp>

#include <stdexcept>
#include <string>

namespace sidecar {

/// Generic document exchanged with the worker. Object keys keep insertion order.
using Document = nlohmann::ordered_json;

namespace codec {

enum class WireFormat {
    Json,
    MsgPack,
};

class CodecError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

const char* to_string(WireFormat format);

/// Parses "json" / "msgpack" (case-sensitive). Throws CodecError otherwise.
WireFormat parse_wire_format(const std::string& name);

/// Serializes a document. Throws CodecError when the value cannot be represented.
std::string encode(const Document& doc, WireFormat format);

/// Parses exactly one document from bytes. Trailing data is an error.
Document decode(const std::string& bytes, WireFormat format);

Document from_msgpack(const msgpack::object& obj);
void pack_document(msgpack::packer<msgpack::sbuffer>& pk, const Document& doc);

const Document* find_key(const Document& map_doc, const std::string& key);
std::string as_string(const Document& doc, const std::string& fallback = "");
bool as_bool(const Document& doc, bool fallback = false);
/// fallback also when an unsigned value does not fit in int64_t
int64_t as_int64(const Document& doc, int64_t fallback = 0);

} // namespace codec
} // namespace sidecar
