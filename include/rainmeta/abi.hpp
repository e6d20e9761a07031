// ====================================================================================
// RAINMETA - Solidity ABI Words
//
// Just enough of the Solidity ABI head/tail layout for the array-of-tuple payloads
// used by authoring meta and for emitMeta(bytes32,bytes) calldata.
// ====================================================================================

#ifndef RAINMETA_ABI_HPP_
#define RAINMETA_ABI_HPP_

#include <array>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "rainmeta/crypto.hpp"
#include "rainmeta/status.hpp"

namespace rainmeta::v1 {

// Left-aligned, zero-padded bytes32 form of a short string.
util::StatusOr<Hash32> StrToBytes32(std::string_view text);
// Inverse of StrToBytes32; stops at the first zero byte.
util::StatusOr<std::string> Bytes32ToStr(const Hash32& word);

namespace abi {

constexpr size_t kWordSize = 32;

void AppendUint(byte_vec* out, uint64_t value);
void AppendWord(byte_vec* out, const Hash32& word);
// Length word followed by the data right-padded to a word boundary.
void AppendDynamicBytes(byte_vec* out, util::Span<const uint8_t> data);
size_t PaddedSize(size_t length);

class Decoder {
public:
    explicit Decoder(util::Span<const uint8_t> data) : data_(data) {}

    util::StatusOr<Hash32> WordAt(size_t offset) const;
    // Reads a word that must fit in `max_bits` bits.
    util::StatusOr<uint64_t> UintAt(size_t offset, unsigned max_bits = 64) const;
    util::StatusOr<byte_vec> DynamicBytesAt(size_t offset) const;
    size_t size() const { return data_.size(); }

private:
    util::Span<const uint8_t> data_;
};

std::array<uint8_t, 4> Selector(std::string_view signature);

}  // namespace abi

}  // namespace rainmeta::v1

#endif  // RAINMETA_ABI_HPP_
