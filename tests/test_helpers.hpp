#ifndef RAINMETA_TESTS_TEST_HELPERS_HPP_
#define RAINMETA_TESTS_TEST_HELPERS_HPP_

#include <string>
#include <string_view>

#include <gtest/gtest.h>

#include "rainmeta/crypto.hpp"

namespace rainmeta::test_support {

inline v1::byte_vec BytesOf(std::string_view text) {
    return v1::byte_vec(text.begin(), text.end());
}

inline v1::byte_vec FromHex(std::string_view hex) {
    auto bytes_or = util::HexDecode(hex);
    EXPECT_TRUE(bytes_or.ok()) << bytes_or.status().ToString();
    return bytes_or.ok() ? bytes_or.value() : v1::byte_vec();
}

inline std::string HexOf(const v1::Hash32& hash) {
    return util::HexEncode(util::Span<const uint8_t>(hash.data(), hash.size()), false);
}

}  // namespace rainmeta::test_support

#endif  // RAINMETA_TESTS_TEST_HELPERS_HPP_
