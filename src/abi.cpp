#include "rainmeta/abi.hpp"

#include <algorithm>

#include "rainmeta/document.hpp"

namespace rainmeta::v1 {

util::StatusOr<Hash32> StrToBytes32(std::string_view text) {
    if (text.size() > kHashSize) return util::Status::BiggerThan32Bytes();
    Hash32 word{};
    std::copy(text.begin(), text.end(), word.begin());
    return word;
}

util::StatusOr<std::string> Bytes32ToStr(const Hash32& word) {
    const auto end = std::find(word.begin(), word.end(), 0);
    return Utf8FromBytes(util::Span<const uint8_t>(word.data(), static_cast<size_t>(end - word.begin())));
}

namespace abi {

void AppendUint(byte_vec* out, uint64_t value) {
    out->insert(out->end(), kWordSize - 8, 0);
    for (int i = 7; i >= 0; --i) out->push_back(static_cast<uint8_t>((value >> (8 * i)) & 0xFF));
}

void AppendWord(byte_vec* out, const Hash32& word) {
    out->insert(out->end(), word.begin(), word.end());
}

size_t PaddedSize(size_t length) {
    return (length + kWordSize - 1) / kWordSize * kWordSize;
}

void AppendDynamicBytes(byte_vec* out, util::Span<const uint8_t> data) {
    AppendUint(out, data.size());
    out->insert(out->end(), data.begin(), data.end());
    out->insert(out->end(), PaddedSize(data.size()) - data.size(), 0);
}

util::StatusOr<Hash32> Decoder::WordAt(size_t offset) const {
    if (offset > data_.size() || data_.size() - offset < kWordSize) {
        return util::Status::AbiError("word at offset " + std::to_string(offset) + " is out of bounds");
    }
    Hash32 word;
    std::copy(data_.begin() + offset, data_.begin() + offset + kWordSize, word.begin());
    return word;
}

util::StatusOr<uint64_t> Decoder::UintAt(size_t offset, unsigned max_bits) const {
    RAINMETA_ASSIGN_OR_RETURN(Hash32 word, WordAt(offset));
    for (size_t i = 0; i < kWordSize - 8; ++i) {
        if (word[i] != 0) return util::Status::AbiError("integer overflows 64 bits");
    }
    uint64_t value = 0;
    for (size_t i = kWordSize - 8; i < kWordSize; ++i) value = (value << 8) | word[i];
    if (max_bits < 64 && (value >> max_bits) != 0) {
        return util::Status::AbiError("integer overflows " + std::to_string(max_bits) + " bits");
    }
    return value;
}

util::StatusOr<byte_vec> Decoder::DynamicBytesAt(size_t offset) const {
    RAINMETA_ASSIGN_OR_RETURN(uint64_t length, UintAt(offset));
    const size_t start = offset + kWordSize;
    if (length > data_.size() - start) return util::Status::AbiError("dynamic bytes exceed input");
    return byte_vec(data_.begin() + start, data_.begin() + start + length);
}

std::array<uint8_t, 4> Selector(std::string_view signature) {
    const Hash32 hash = Keccak256(signature);
    return {hash[0], hash[1], hash[2], hash[3]};
}

}  // namespace abi

}  // namespace rainmeta::v1
