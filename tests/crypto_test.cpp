#include <gtest/gtest.h>

#include "rainmeta/crypto.hpp"
#include "test_helpers.hpp"

using namespace rainmeta;
using namespace rainmeta::v1;
using rainmeta::test_support::BytesOf;
using rainmeta::test_support::HexOf;

TEST(KeccakTest, KnownVectors) {
    EXPECT_EQ(HexOf(Keccak256(std::string_view(""))),
              "c5d2460186f7233c927e7db2dcc703c0e500b653ca82273b7bfad8045d85a470");
    EXPECT_EQ(HexOf(Keccak256(std::string_view("abc"))),
              "4e03657aea45a94fc7d47ba826c8d667c0d1e6e33a64a036ec44f58fa12d6c45");
    EXPECT_EQ(HexOf(Keccak256(std::string_view("The quick brown fox jumps over the lazy dog"))),
              "4d741b6f1eb29cb2a9b9911c82f56fa8d73b04959d3d9d222895df6c0b28aa15");
}

TEST(KeccakTest, BlockBoundaries) {
    EXPECT_EQ(HexOf(Keccak256(std::string(135, 'a'))),
              "34367dc248bbd832f4e3e69dfaac2f92638bd0bbd18f2912ba4ef454919cf446");
    EXPECT_EQ(HexOf(Keccak256(std::string(136, 'a'))),
              "a6c4d403279fe3e0af03729caada8374b5ca54d8065329a3ebcaeb4b60aa386e");
    EXPECT_EQ(HexOf(Keccak256(std::string(137, 'a'))),
              "d869f639c7046b4929fc92a4d988a8b22c55fbadb802c0c66ebcd484f1915f39");
    EXPECT_EQ(HexOf(Keccak256(std::string(200, 'a'))),
              "96ea54061def936c4be90b518992fdc6f12f535068a256229aca54267b4d084d");
}

TEST(KeccakTest, SpanAndTextOverloadsAgree) {
    const std::string text = "#main _ _: int-add(1 2)";
    EXPECT_EQ(Keccak256(std::string_view(text)), Keccak256(BytesOf(text)));
}

TEST(HexTest, Encode) {
    const byte_vec bytes = {0x00, 0xab, 0xff, 0x10};
    EXPECT_EQ(util::HexEncode(bytes), "0x00abff10");
    EXPECT_EQ(util::HexEncode(bytes, false), "00abff10");
    EXPECT_EQ(util::HexEncode(byte_vec()), "0x");
}

TEST(HexTest, DecodeAcceptsPrefixAndCase) {
    const byte_vec expected = {0xde, 0xad, 0xbe, 0xef};
    for (const char* text : {"deadbeef", "0xdeadbeef", "0XDEADBEEF", "0xDeAdBeEf"}) {
        auto bytes_or = util::HexDecode(text);
        ASSERT_TRUE(bytes_or.ok()) << text;
        EXPECT_EQ(bytes_or.value(), expected) << text;
    }
}

TEST(HexTest, DecodeEmpty) {
    auto bytes_or = util::HexDecode("0x");
    ASSERT_TRUE(bytes_or.ok());
    EXPECT_TRUE(bytes_or.value().empty());
}

TEST(HexTest, DecodeRejectsMalformed) {
    for (const char* text : {"0xabc", "zz", "0x12 34", "0x0g"}) {
        auto bytes_or = util::HexDecode(text);
        ASSERT_FALSE(bytes_or.ok()) << text;
        EXPECT_EQ(bytes_or.status().code(), util::StatusCode::kDecodeHexStringError) << text;
    }
}

TEST(StatusTest, ToStringCarriesCodeName) {
    EXPECT_EQ(util::Status::Ok().ToString(), "OK");
    EXPECT_EQ(util::Status::CorruptMeta().ToString(), "CORRUPT_META: corrupt meta");
    EXPECT_EQ(util::Status::HashMismatch("x").code(), util::StatusCode::kHashMismatch);
}

TEST(StatusTest, StatusOrFromOkStatusIsAnError) {
    util::StatusOr<int> value_or(util::Status::Ok());
    EXPECT_FALSE(value_or.ok());
    EXPECT_THROW(value_or.value(), std::runtime_error);
}
