#include <gtest/gtest.h>

#include "rainmeta/typed_meta.hpp"
#include "test_helpers.hpp"

using namespace rainmeta;
using namespace rainmeta::v1;
using rainmeta::test_support::BytesOf;

namespace {

std::string SequenceHex(const std::vector<MetaDocumentItem>& items, bool prefixed) {
    return util::HexEncode(MetaDocumentItem::CborEncodeSeq(items, KnownMagic::kRainMetaDocumentV1), prefixed);
}

std::vector<MetaDocumentItem> MixedItems() {
    AuthoringMeta authoring;
    authoring.items.push_back({"stack", 16, "Copies an existing value from the stack."});
    Address zero{};
    return {
        DotrainSource{"#main _ _: int-add(1 2)"}.ToDocumentItem(),
        authoring.ToDocumentItem().value(),
        AddressListMeta::FromAddresses({zero}).ToDocumentItem(),
        RainlangSourceMeta{"_: int-add(1 2);"}.ToDocumentItem(),
    };
}

}  // namespace

TEST(TypedMetaTest, ParsesMixedSequence) {
    for (bool prefixed : {true, false}) {
        auto metas = ParseFromHex(SequenceHex(MixedItems(), prefixed));
        ASSERT_TRUE(metas.ok()) << metas.status().ToString();
        ASSERT_EQ(metas.value().size(), 4u);
        EXPECT_TRUE(std::holds_alternative<DotrainSource>(metas.value()[0]));
        EXPECT_TRUE(std::holds_alternative<AuthoringMeta>(metas.value()[1]));
        EXPECT_TRUE(std::holds_alternative<AddressListMeta>(metas.value()[2]));
        EXPECT_TRUE(std::holds_alternative<RainlangSourceMeta>(metas.value()[3]));
        EXPECT_EQ(std::get<DotrainSource>(metas.value()[0]).text, "#main _ _: int-add(1 2)");
        EXPECT_EQ(std::get<AuthoringMeta>(metas.value()[1]).items[0].word, "stack");
    }
}

TEST(TypedMetaTest, MagicOfFollowsAlternative) {
    auto metas = ParseFromHex(SequenceHex(MixedItems(), true));
    ASSERT_TRUE(metas.ok());
    const std::vector<MetaDocumentItem> items = MixedItems();
    for (size_t i = 0; i < items.size(); ++i) EXPECT_EQ(MagicOf(metas.value()[i]), items[i].magic);

    EXPECT_EQ(MagicOf(TypedMeta(DotrainMeta{"x"})), KnownMagic::kDotrainV1);
    EXPECT_EQ(MagicOf(TypedMeta(OpMeta{})), KnownMagic::kOpMetaV1);
    EXPECT_EQ(MagicOf(TypedMeta(DotrainGuiState{})), KnownMagic::kDotrainGuiStateV1);
}

TEST(TypedMetaTest, BadHex) {
    EXPECT_EQ(ParseFromHex("0xzz").status().code(), util::StatusCode::kDecodeHexStringError);
    EXPECT_EQ(ParseFromHex("0xabc").status().code(), util::StatusCode::kDecodeHexStringError);
}

TEST(TypedMetaTest, RequiresDocumentPrefix) {
    const std::string bare = util::HexEncode(DotrainSource{"x"}.ToDocumentItem().CborEncode());
    EXPECT_EQ(ParseFromHex(bare).status().code(), util::StatusCode::kCorruptMeta);
    EXPECT_EQ(ParseFromHex("").status().code(), util::StatusCode::kCorruptMeta);
}

TEST(TypedMetaTest, FailsOnFirstBadItem) {
    const std::vector<MetaDocumentItem> items = {
        DotrainSource{"ok"}.ToDocumentItem(),
        MetaDocumentItem{byte_vec(21, 0x01), KnownMagic::kAddressList, ContentType::kOctetStream},
        MetaDocumentItem{byte_vec{0xc3, 0x28}, KnownMagic::kRainlangV1},
    };
    EXPECT_EQ(ParseFromHex(SequenceHex(items, true)).status().code(), util::StatusCode::kAbiError);
}

TEST(TypedMetaTest, DocumentWrapperIsUnsupported) {
    const MetaDocumentItem wrapper{BytesOf("inner"), KnownMagic::kRainMetaDocumentV1};
    EXPECT_EQ(TypedMetaFromItem(wrapper).status().code(), util::StatusCode::kUnsupportedMeta);
    EXPECT_EQ(ParseFromHex(SequenceHex({wrapper}, true)).status().code(), util::StatusCode::kUnsupportedMeta);
}

TEST(TypedMetaTest, MalformedAuthoringMetaV2IsUnsupported) {
    const MetaDocumentItem item{byte_vec(10, 0xff), KnownMagic::kAuthoringMetaV2, ContentType::kOctetStream};
    EXPECT_EQ(TypedMetaFromItem(item).status().code(), util::StatusCode::kUnsupportedMeta);
}

TEST(TypedMetaTest, GuiStateDispatch) {
    DotrainGuiState state;
    state.selected_deployment = "base";
    auto meta = TypedMetaFromItem(state.ToDocumentItem());
    ASSERT_TRUE(meta.ok()) << meta.status().ToString();
    ASSERT_TRUE(std::holds_alternative<DotrainGuiState>(meta.value()));
    EXPECT_EQ(std::get<DotrainGuiState>(meta.value()), state);
}
