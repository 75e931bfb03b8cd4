#include "document_codec.hpp"

#include <cstdint>
#include <limits>
#include <vector>

namespace sidecar::codec {

namespace {

std::string encode_json(const Document& doc) {
    try {
        return doc.dump();
    } catch (const nlohmann::json::exception& exc) {
        throw CodecError(std::string("JSON encode failed: ") + exc.what());
    }
}

Document decode_json(const std::string& bytes) {
    try {
        return Document::parse(bytes);
    } catch (const nlohmann::json::exception& exc) {
        throw CodecError(std::string("JSON parse failed: ") + exc.what());
    }
}

std::string encode_msgpack(const Document& doc) {
    msgpack::sbuffer buffer;
    msgpack::packer<msgpack::sbuffer> pk(&buffer);
    pack_document(pk, doc);
    return std::string(buffer.data(), buffer.size());
}

Document decode_msgpack(const std::string& bytes) {
    msgpack::object_handle handle;
    std::size_t offset = 0;
    try {
        handle = msgpack::unpack(bytes.data(), bytes.size(), offset);
    } catch (const std::exception& exc) {
        throw CodecError(std::string("MessagePack parse failed: ") + exc.what());
    }
    if (offset != bytes.size()) {
        throw CodecError("MessagePack parse failed: " + std::to_string(bytes.size() - offset) +
                         " trailing bytes after document");
    }
    return from_msgpack(handle.get());
}

} // namespace

const char* to_string(WireFormat format) {
    switch (format) {
        case WireFormat::Json:
            return "json";
        case WireFormat::MsgPack:
            return "msgpack";
    }
    return "unknown";
}

WireFormat parse_wire_format(const std::string& name) {
    if (name == "json") {
        return WireFormat::Json;
    }
    if (name == "msgpack") {
        return WireFormat::MsgPack;
    }
    throw CodecError("Unknown wire format: " + name);
}

std::string encode(const Document& doc, WireFormat format) {
    if (format == WireFormat::MsgPack) {
        return encode_msgpack(doc);
    }
    return encode_json(doc);
}

Document decode(const std::string& bytes, WireFormat format) {
    if (format == WireFormat::MsgPack) {
        return decode_msgpack(bytes);
    }
    return decode_json(bytes);
}

Document from_msgpack(const msgpack::object& obj) {
    switch (obj.type) {
        case msgpack::type::NIL:
            return Document();
        case msgpack::type::BOOLEAN:
            return Document(obj.via.boolean);
        case msgpack::type::POSITIVE_INTEGER:
            return Document(static_cast<uint64_t>(obj.via.u64));
        case msgpack::type::NEGATIVE_INTEGER:
            return Document(static_cast<int64_t>(obj.via.i64));
        case msgpack::type::FLOAT32:
        case msgpack::type::FLOAT64:
            return Document(obj.via.f64);
        case msgpack::type::STR:
            return Document(std::string(obj.via.str.ptr, obj.via.str.size));
        case msgpack::type::BIN: {
            const auto* begin = reinterpret_cast<const uint8_t*>(obj.via.bin.ptr);
            return Document::binary(std::vector<uint8_t>(begin, begin + obj.via.bin.size));
        }
        case msgpack::type::ARRAY: {
            Document arr = Document::array();
            for (uint32_t i = 0; i < obj.via.array.size; ++i) {
                arr.push_back(from_msgpack(obj.via.array.ptr[i]));
            }
            return arr;
        }
        case msgpack::type::MAP: {
            Document map = Document::object();
            auto entries = obj.via.map;
            for (uint32_t i = 0; i < entries.size; ++i) {
                if (entries.ptr[i].key.type != msgpack::type::STR) {
                    throw CodecError("MessagePack map key is not a string");
                }
                std::string key(entries.ptr[i].key.via.str.ptr, entries.ptr[i].key.via.str.size);
                map[key] = from_msgpack(entries.ptr[i].val);
            }
            return map;
        }
        default:
            break;
    }
    throw CodecError("Unsupported MessagePack type: " + std::to_string(static_cast<int>(obj.type)));
}

void pack_document(msgpack::packer<msgpack::sbuffer>& pk, const Document& doc) {
    switch (doc.type()) {
        case Document::value_t::null:
            pk.pack_nil();
            return;
        case Document::value_t::boolean:
            pk.pack(doc.get<bool>());
            return;
        case Document::value_t::number_integer:
            pk.pack(doc.get<int64_t>());
            return;
        case Document::value_t::number_unsigned:
            pk.pack(doc.get<uint64_t>());
            return;
        case Document::value_t::number_float:
            pk.pack(doc.get<double>());
            return;
        case Document::value_t::string:
            pk.pack(doc.get_ref<const std::string&>());
            return;
        case Document::value_t::binary: {
            const auto& bin = doc.get_binary();
            pk.pack_bin(static_cast<uint32_t>(bin.size()));
            pk.pack_bin_body(reinterpret_cast<const char*>(bin.data()), static_cast<uint32_t>(bin.size()));
            return;
        }
        case Document::value_t::array:
            pk.pack_array(static_cast<uint32_t>(doc.size()));
            for (const auto& item : doc) {
                pack_document(pk, item);
            }
            return;
        case Document::value_t::object:
            pk.pack_map(static_cast<uint32_t>(doc.size()));
            for (const auto& [key, value] : doc.items()) {
                pk.pack(key);
                pack_document(pk, value);
            }
            return;
        case Document::value_t::discarded:
            break;
    }
    throw CodecError("Cannot encode a discarded document value");
}

const Document* find_key(const Document& map_doc, const std::string& key) {
    if (!map_doc.is_object()) {
        return nullptr;
    }

    auto it = map_doc.find(key);
    if (it == map_doc.end()) {
        return nullptr;
    }
    return &*it;
}

std::string as_string(const Document& doc, const std::string& fallback) {
    if (doc.is_string()) {
        return doc.get<std::string>();
    }
    return fallback;
}

bool as_bool(const Document& doc, bool fallback) {
    if (doc.is_boolean()) {
        return doc.get<bool>();
    }
    return fallback;
}

int64_t as_int64(const Document& doc, int64_t fallback) {
    if (doc.is_number_unsigned()) {
        uint64_t raw = doc.get<uint64_t>();
        if (raw > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
            return fallback;
        }
        return static_cast<int64_t>(raw);
    }
    if (doc.is_number_integer()) {
        return doc.get<int64_t>();
    }
    return fallback;
}

} // namespace sidecar::codec
