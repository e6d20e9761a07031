#include <gtest/gtest.h>

#include "rainmeta/abi.hpp"
#include "rainmeta/deployment.hpp"
#include "test_helpers.hpp"

using namespace rainmeta;
using namespace rainmeta::v1;
using rainmeta::test_support::FromHex;
using rainmeta::test_support::HexOf;

namespace {

const char* kSource = "#main _ _: int-add(1 2)";
const char* kDocumentHash = "7dc0ef9778bdc60b6a7afc73989e79889fdd725566cf1f56a9d3a0acbbaee5df";
const char* kSequenceHex =
    "ff0a89c674ee7874a30057236d61696e205f205f3a20696e742d6164642831203229011bffa15ef0fc437099"
    "0278186170706c69636174696f6e2f6f637465742d73747265616d";

std::string Word(uint64_t value) {
    byte_vec word;
    v1::abi::AppendUint(&word, value);
    return util::HexEncode(word, false);
}

class RecordingEncoder : public CalldataEncoder {
public:
    util::StatusOr<byte_vec> EncodeEmitMeta(const Hash32& subject, util::Span<const uint8_t> meta) const override {
        last_subject = subject;
        last_meta_size = meta.size();
        return byte_vec{0x01};
    }
    mutable Hash32 last_subject{};
    mutable size_t last_meta_size = 0;
};

class FailingEncoder : public CalldataEncoder {
public:
    util::StatusOr<byte_vec> EncodeEmitMeta(const Hash32&, util::Span<const uint8_t>) const override {
        return util::Status::AbiError("encoder unavailable");
    }
};

}  // namespace

TEST(DeploymentTest, DotrainDeployment) {
    auto data = GenerateDotrainDeployment(kSource);
    ASSERT_TRUE(data.ok()) << data.status().ToString();
    EXPECT_EQ(data.value().subject, std::string("0x") + kDocumentHash);
    EXPECT_EQ(data.value().meta_bytes, std::string("0x") + kSequenceHex);

    const std::string expected_calldata = std::string("0x37480e2a") + kDocumentHash + Word(64) + Word(71) +
                                          kSequenceHex + std::string(2 * 25, '0');
    EXPECT_EQ(data.value().calldata, expected_calldata);
    EXPECT_EQ(FromHex(data.value().calldata).size(), 4u + 32 + 32 + 32 + 96);
}

TEST(DeploymentTest, JsonForm) {
    auto data = GenerateDotrainDeployment(kSource);
    ASSERT_TRUE(data.ok());
    const nlohmann::json json = data.value().ToJson();
    EXPECT_EQ(json["subject"], data.value().subject);
    EXPECT_EQ(json["meta_bytes"], data.value().meta_bytes);
    EXPECT_EQ(json["calldata"], data.value().calldata);
    EXPECT_EQ(json.size(), 3u);
}

TEST(DeploymentTest, RejectsBlankContent) {
    for (const char* content : {"", "   ", "\n\t  \r\n"}) {
        auto data = GenerateDotrainDeployment(content);
        ASSERT_FALSE(data.ok());
        EXPECT_EQ(data.status().code(), util::StatusCode::kInvalidInput);
    }
    EXPECT_TRUE(ValidateDotrainContent(" x ").ok());
}

TEST(DeploymentTest, CustomEncoderReceivesSubject) {
    RecordingEncoder encoder;
    auto data = GenerateDotrainDeployment(kSource, encoder);
    ASSERT_TRUE(data.ok());
    EXPECT_EQ(HexOf(encoder.last_subject), kDocumentHash);
    EXPECT_EQ(encoder.last_meta_size, 71u);
    EXPECT_EQ(data.value().calldata, "0x01");
}

TEST(DeploymentTest, EncoderErrorsPropagate) {
    FailingEncoder encoder;
    EXPECT_EQ(GenerateDotrainDeployment(kSource, encoder).status().code(), util::StatusCode::kAbiError);
}

TEST(DeploymentTest, EmitMetaCalldataForItem) {
    const MetaDocumentItem item = DotrainSource{kSource}.ToDocumentItem();
    auto calldata = GenerateEmitMetaCalldata(item);
    ASSERT_TRUE(calldata.ok());
    const byte_vec& bytes = calldata.value();
    ASSERT_EQ(bytes.size(), 4u + 32 + 32 + 32 + 64);
    EXPECT_EQ(byte_vec(bytes.begin() + 4, bytes.begin() + 36), ToBytes(item.ItemHash()));
    EXPECT_EQ(byte_vec(bytes.begin() + 100, bytes.begin() + 163), item.CborEncode());
}
