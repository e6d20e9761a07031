#include <gtest/gtest.h>

#include "rainmeta/document.hpp"
#include "test_helpers.hpp"

using namespace rainmeta;
using namespace rainmeta::v1;
using rainmeta::test_support::BytesOf;
using rainmeta::test_support::FromHex;
using rainmeta::test_support::HexOf;

namespace {

const char* kDotrainText = "#main _ _: int-add(1 2)";

const char* kDotrainItemHex =
    "a30057236d61696e205f205f3a20696e742d6164642831203229011bffa15ef0fc437099"
    "0278186170706c69636174696f6e2f6f637465742d73747265616d";

MetaDocumentItem DotrainSourceItem() {
    return MetaDocumentItem{BytesOf(kDotrainText), KnownMagic::kDotrainSourceV1, ContentType::kOctetStream};
}

byte_vec WithDocumentPrefix(const byte_vec& body) {
    const auto prefix = ToPrefixBytes(KnownMagic::kRainMetaDocumentV1);
    byte_vec out(prefix.begin(), prefix.end());
    out.insert(out.end(), body.begin(), body.end());
    return out;
}

}  // namespace

TEST(MetaDocumentTest, EncodesDotrainSourceItem) {
    const MetaDocumentItem item = DotrainSourceItem();
    EXPECT_EQ(item.FieldCount(), 3u);
    EXPECT_EQ(item.CborEncode(), FromHex(kDotrainItemHex));
    EXPECT_EQ(HexOf(item.ItemHash()), "3a8066a4fd09b4be08f4923e2e203a47727a9f8cfc8dc100a3a29b8a85ac7757");
}

TEST(MetaDocumentTest, DocumentHashCoversSequencePrefix) {
    const MetaDocumentItem item = DotrainSourceItem();
    const byte_vec seq = MetaDocumentItem::CborEncodeSeq({item}, KnownMagic::kRainMetaDocumentV1);
    EXPECT_EQ(seq.size(), 71u);
    EXPECT_EQ(seq, WithDocumentPrefix(FromHex(kDotrainItemHex)));
    EXPECT_EQ(HexOf(item.DocumentHash()), "7dc0ef9778bdc60b6a7afc73989e79889fdd725566cf1f56a9d3a0acbbaee5df");
    EXPECT_EQ(item.DocumentHash(), Keccak256(seq));
    EXPECT_NE(item.DocumentHash(), item.ItemHash());
}

TEST(MetaDocumentTest, EncodingIsDeterministic) {
    const MetaDocumentItem item = DotrainSourceItem();
    EXPECT_EQ(item.CborEncode(), item.CborEncode());
    EXPECT_EQ(item.ItemHash(), DotrainSourceItem().ItemHash());
}

TEST(MetaDocumentTest, OmitsAbsentFields) {
    MetaDocumentItem item{BytesOf("x"), KnownMagic::kRainlangV1};
    EXPECT_EQ(item.FieldCount(), 2u);
    EXPECT_EQ(item.CborEncode(), FromHex("a200417801" "1bff1c198cec3b48a7"));

    item.content_language = ContentLanguage::kEn;
    EXPECT_EQ(item.FieldCount(), 3u);
    EXPECT_EQ(item.CborEncode(), FromHex("a300417801" "1bff1c198cec3b48a7" "0462656e"));
}

TEST(MetaDocumentTest, DecodesSequence) {
    const byte_vec seq = WithDocumentPrefix(FromHex(kDotrainItemHex));
    auto items = MetaDocumentItem::CborDecode(seq);
    ASSERT_TRUE(items.ok()) << items.status().ToString();
    ASSERT_EQ(items.value().size(), 1u);
    EXPECT_EQ(items.value()[0], DotrainSourceItem());
}

TEST(MetaDocumentTest, DecodesBodyWithoutPrefix) {
    auto items = MetaDocumentItem::CborDecode(FromHex(kDotrainItemHex));
    ASSERT_TRUE(items.ok());
    EXPECT_EQ(items.value().size(), 1u);
}

TEST(MetaDocumentTest, MultiItemSequenceKeepsOrder) {
    auto deflated = EncodeContent(ContentEncoding::kDeflate, BytesOf("{\"name\":\"caller\"}"));
    ASSERT_TRUE(deflated.ok());
    const std::vector<MetaDocumentItem> items = {
        DotrainSourceItem(),
        MetaDocumentItem{deflated.value(), KnownMagic::kInterpreterCallerMetaV1, ContentType::kJson,
                         ContentEncoding::kDeflate, ContentLanguage::kEn},
        MetaDocumentItem{BytesOf("word"), KnownMagic::kRainlangSourceV1},
    };
    const byte_vec seq = MetaDocumentItem::CborEncodeSeq(items, KnownMagic::kRainMetaDocumentV1);
    auto decoded = MetaDocumentItem::CborDecode(seq);
    ASSERT_TRUE(decoded.ok()) << decoded.status().ToString();
    EXPECT_EQ(decoded.value(), items);
    EXPECT_EQ(decoded.value()[1].FieldCount(), 5u);
}

TEST(MetaDocumentTest, TrailingBytesAreCorrupt) {
    for (uint8_t trailing : {0x00, 0xa0, 0xff, 0x41}) {
        byte_vec seq = WithDocumentPrefix(FromHex(kDotrainItemHex));
        seq.push_back(trailing);
        auto items = MetaDocumentItem::CborDecode(seq);
        ASSERT_FALSE(items.ok()) << static_cast<int>(trailing);
        EXPECT_EQ(items.status().code(), util::StatusCode::kCorruptMeta) << static_cast<int>(trailing);
    }
}

TEST(MetaDocumentTest, EmptyInputIsCorrupt) {
    EXPECT_EQ(MetaDocumentItem::CborDecode(byte_vec()).status().code(), util::StatusCode::kCorruptMeta);
    EXPECT_EQ(MetaDocumentItem::CborDecode(WithDocumentPrefix(byte_vec())).status().code(),
              util::StatusCode::kCorruptMeta);
}

TEST(MetaDocumentTest, MalformedItemIsAHardError) {
    byte_vec body;
    cbor::Writer writer(&body);
    writer.WriteMapHeader(3);
    writer.WriteUnsigned(MetaMapKey::kPayload);
    writer.WriteBytes(BytesOf("x"));
    writer.WriteUnsigned(MetaMapKey::kMagic);
    writer.WriteUnsigned(ToU64(KnownMagic::kRainlangV1));
    writer.WriteUnsigned(9);
    writer.WriteText("unexpected");
    auto items = MetaDocumentItem::CborDecode(WithDocumentPrefix(body));
    ASSERT_FALSE(items.ok());
    EXPECT_EQ(items.status().code(), util::StatusCode::kCborError);
}

TEST(MetaDocumentTest, UnknownMagicInItem) {
    byte_vec body;
    cbor::Writer writer(&body);
    writer.WriteMapHeader(2);
    writer.WriteUnsigned(MetaMapKey::kPayload);
    writer.WriteBytes(BytesOf("x"));
    writer.WriteUnsigned(MetaMapKey::kMagic);
    writer.WriteUnsigned(0xff00000000000001ULL);
    EXPECT_EQ(MetaDocumentItem::CborDecode(body).status().code(), util::StatusCode::kUnknownMagic);
}

TEST(MetaDocumentTest, UnknownContentTypeText) {
    byte_vec body;
    cbor::Writer writer(&body);
    writer.WriteMapHeader(3);
    writer.WriteUnsigned(MetaMapKey::kPayload);
    writer.WriteBytes(BytesOf("x"));
    writer.WriteUnsigned(MetaMapKey::kMagic);
    writer.WriteUnsigned(ToU64(KnownMagic::kRainlangV1));
    writer.WriteUnsigned(MetaMapKey::kContentType);
    writer.WriteText("text/plain");
    EXPECT_EQ(MetaDocumentItem::CborDecode(body).status().code(), util::StatusCode::kCborError);
}

TEST(MetaDocumentTest, UnpackRemovesDeflate) {
    const std::string text = "#main _ _: int-add(1 2) int-add(3 4) int-add(5 6)";
    auto deflated = EncodeContent(ContentEncoding::kDeflate, BytesOf(text));
    ASSERT_TRUE(deflated.ok());
    const MetaDocumentItem item{deflated.value(), KnownMagic::kDotrainV1, ContentType::kOctetStream,
                                ContentEncoding::kDeflate, ContentLanguage::kEn};
    auto unpacked = item.Unpack();
    ASSERT_TRUE(unpacked.ok());
    EXPECT_EQ(unpacked.value(), BytesOf(text));

    auto as_text = item.UnpackInto<std::string>();
    ASSERT_TRUE(as_text.ok());
    EXPECT_EQ(as_text.value(), text);
}

TEST(MetaDocumentTest, UnpackIntoRejectsDocumentWrapper) {
    const MetaDocumentItem wrapper{BytesOf("nested"), KnownMagic::kRainMetaDocumentV1};
    EXPECT_EQ(wrapper.UnpackInto<std::string>().status().code(), util::StatusCode::kUnsupportedMeta);
    EXPECT_EQ(wrapper.UnpackInto<byte_vec>().status().code(), util::StatusCode::kUnsupportedMeta);
    EXPECT_FALSE(IsUnpackable(KnownMagic::kRainMetaDocumentV1));
    EXPECT_TRUE(IsUnpackable(KnownMagic::kDotrainV1));
}

TEST(MetaDocumentTest, UnpackIntoRejectsMagicsOutsideWhitelist) {
    size_t unpackable = 0;
    for (KnownMagic magic : AllKnownMagics()) {
        if (IsUnpackable(magic)) ++unpackable;
    }
    EXPECT_EQ(unpackable, 8u);
    for (KnownMagic magic : {KnownMagic::kAuthoringMetaV2, KnownMagic::kAddressList, KnownMagic::kDotrainSourceV1,
                             KnownMagic::kDotrainGuiStateV1}) {
        const MetaDocumentItem item{BytesOf("payload"), magic};
        EXPECT_FALSE(IsUnpackable(magic)) << MagicName(magic);
        EXPECT_EQ(item.UnpackInto<std::string>().status().code(), util::StatusCode::kUnsupportedMeta);
        EXPECT_EQ(item.UnpackInto<byte_vec>().status().code(), util::StatusCode::kUnsupportedMeta);
    }
    const MetaDocumentItem op_meta{BytesOf("[]"), KnownMagic::kOpMetaV1};
    EXPECT_TRUE(op_meta.UnpackInto<std::string>().ok());
}

TEST(MetaDocumentTest, InvalidUtf8IsRejected) {
    const MetaDocumentItem item{byte_vec{0x61, 0xc3, 0x28}, KnownMagic::kRainlangV1};
    EXPECT_EQ(item.UnpackInto<std::string>().status().code(), util::StatusCode::kUtf8Error);
    EXPECT_EQ(Utf8FromBytes(byte_vec{0xe0, 0x80, 0x80}).status().code(), util::StatusCode::kUtf8Error);
    EXPECT_EQ(Utf8FromBytes(byte_vec{0xed, 0xa0, 0x80}).status().code(), util::StatusCode::kUtf8Error);
    EXPECT_TRUE(Utf8FromBytes(BytesOf("caf\xc3\xa9")).ok());
}
