// ====================================================================================
// RAINMETA - Hashing & Hex Transport
// ====================================================================================

#ifndef RAINMETA_CRYPTO_HPP_
#define RAINMETA_CRYPTO_HPP_

#include <array>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "rainmeta/status.hpp"

namespace rainmeta::util {

// Lowercase hex, optionally with a leading "0x".
std::string HexEncode(Span<const uint8_t> bytes, bool prefixed = true);
// Accepts an optional "0x"/"0X" prefix and either letter case.
StatusOr<std::vector<uint8_t>> HexDecode(std::string_view text);

}  // namespace rainmeta::util

namespace rainmeta::v1 {

using byte_vec = std::vector<uint8_t>;
using Hash32 = std::array<uint8_t, 32>;

constexpr size_t kHashSize = 32;

// Keccak-256 with the original 0x01 domain padding (not FIPS-202 SHA3-256).
Hash32 Keccak256(util::Span<const uint8_t> data);
Hash32 Keccak256(std::string_view text);

inline byte_vec ToBytes(const Hash32& hash) { return byte_vec(hash.begin(), hash.end()); }

}  // namespace rainmeta::v1

#endif  // RAINMETA_CRYPTO_HPP_
