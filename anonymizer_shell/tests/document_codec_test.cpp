#include <gtest/gtest.h>

#include "document_codec.hpp"

#include <limits>
#include <string>

using sidecar::Document;
namespace codec = sidecar::codec;

namespace {

Document nested_document() {
    Document doc = Document::object();
    doc["zeta"] = "last key first";
    doc["alpha"] = {{"enabled", true}, {"threshold", -3}, {"ratio", 0.25}};
    doc["items"] = Document::array({1u, "two", nullptr});
    return doc;
}

} // namespace

TEST(DocumentCodec, ParsesWireFormatNames) {
    EXPECT_EQ(codec::parse_wire_format("json"), codec::WireFormat::Json);
    EXPECT_EQ(codec::parse_wire_format("msgpack"), codec::WireFormat::MsgPack);
    EXPECT_THROW(codec::parse_wire_format("JSON"), codec::CodecError);
    EXPECT_STREQ(codec::to_string(codec::WireFormat::MsgPack), "msgpack");
}

TEST(DocumentCodec, JsonKeepsKeyOrder) {
    std::string bytes = codec::encode(nested_document(), codec::WireFormat::Json);
    EXPECT_LT(bytes.find("zeta"), bytes.find("alpha"));

    Document decoded = codec::decode(bytes, codec::WireFormat::Json);
    EXPECT_EQ(decoded, nested_document());
    EXPECT_EQ(decoded.begin().key(), "zeta");
}

TEST(DocumentCodec, MsgPackPreservesStructure) {
    Document original = nested_document();
    Document decoded = codec::decode(codec::encode(original, codec::WireFormat::MsgPack), codec::WireFormat::MsgPack);

    EXPECT_EQ(decoded, original);
    EXPECT_EQ(decoded.begin().key(), "zeta");
    EXPECT_TRUE(decoded["alpha"]["threshold"].is_number_integer());
    EXPECT_EQ(decoded["alpha"]["threshold"].get<int64_t>(), -3);
}

TEST(DocumentCodec, MalformedJsonIsCodecError) {
    EXPECT_THROW(codec::decode("not a document{", codec::WireFormat::Json), codec::CodecError);
    EXPECT_THROW(codec::decode("", codec::WireFormat::Json), codec::CodecError);
}

TEST(DocumentCodec, MsgPackTrailingBytesAreRejected) {
    std::string bytes = codec::encode(Document::object(), codec::WireFormat::MsgPack);
    bytes.push_back('\x01');

    try {
        codec::decode(bytes, codec::WireFormat::MsgPack);
        FAIL() << "expected CodecError";
    } catch (const codec::CodecError& exc) {
        EXPECT_NE(std::string(exc.what()).find("trailing"), std::string::npos);
    }
}

TEST(DocumentCodec, MsgPackNonStringKeyIsRejected) {
    msgpack::sbuffer buffer;
    msgpack::packer<msgpack::sbuffer> pk(&buffer);
    pk.pack_map(1);
    pk.pack(1);
    pk.pack("value");

    EXPECT_THROW(codec::decode(std::string(buffer.data(), buffer.size()), codec::WireFormat::MsgPack),
                 codec::CodecError);
}

TEST(DocumentCodec, InvalidUtf8CannotBeEncodedAsJson) {
    Document doc = Document::object();
    doc["text"] = std::string("\xff\xfe", 2);
    EXPECT_THROW(codec::encode(doc, codec::WireFormat::Json), codec::CodecError);
}

TEST(DocumentCodec, FindKeyAndAccessors) {
    Document doc = nested_document();
    ASSERT_NE(codec::find_key(doc, "alpha"), nullptr);
    EXPECT_EQ(codec::find_key(doc, "missing"), nullptr);
    EXPECT_EQ(codec::find_key(doc["items"], "alpha"), nullptr);

    EXPECT_EQ(codec::as_string(doc["zeta"]), "last key first");
    EXPECT_EQ(codec::as_string(doc["items"], "fallback"), "fallback");
    EXPECT_TRUE(codec::as_bool(doc["alpha"]["enabled"]));
    EXPECT_EQ(codec::as_int64(doc["alpha"]["threshold"]), -3);
    EXPECT_EQ(codec::as_int64(doc["zeta"], 9), 9);
}

TEST(DocumentCodec, AsInt64RejectsUnsignedOutOfRange) {
    Document huge = std::numeric_limits<uint64_t>::max();
    EXPECT_EQ(codec::as_int64(huge, -1), -1);
    EXPECT_EQ(codec::as_int64(Document(static_cast<uint64_t>(std::numeric_limits<int64_t>::max()))),
              std::numeric_limits<int64_t>::max());
}
