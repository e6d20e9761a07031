#include "rainmeta/crypto.hpp"

#include <cctype>
#include <cstring>

#include <nettle/base16.h>
#include <nettle/sha3.h>

namespace rainmeta::util {

std::string HexEncode(Span<const uint8_t> bytes, bool prefixed) {
    std::string out(BASE16_ENCODE_LENGTH(bytes.size()), '\0');
    if (!bytes.empty()) base16_encode_update(&out[0], bytes.size(), bytes.data());
    return prefixed ? "0x" + out : out;
}

StatusOr<std::vector<uint8_t>> HexDecode(std::string_view text) {
    if (text.size() >= 2 && text[0] == '0' && (text[1] == 'x' || text[1] == 'X')) text.remove_prefix(2);
    for (char c : text) {
        if (!std::isxdigit(static_cast<unsigned char>(c))) return Status::DecodeHexStringError("invalid hex character");
    }
    if (text.size() % 2 != 0) return Status::DecodeHexStringError("odd number of hex digits");

    std::vector<uint8_t> out(BASE16_DECODE_LENGTH(text.size()));
    struct base16_decode_ctx ctx;
    base16_decode_init(&ctx);
    size_t out_len = out.size();
    if (!text.empty() && !base16_decode_update(&ctx, &out_len, out.data(), text.size(), text.data())) {
        return Status::DecodeHexStringError("invalid hex character");
    }
    if (!base16_decode_final(&ctx)) return Status::DecodeHexStringError("truncated hex string");
    out.resize(out_len);
    return out;
}

}  // namespace rainmeta::util

namespace rainmeta::v1 {

namespace {

constexpr size_t kKeccakRate = 136;  // bytes per block for Keccak-256

void AbsorbBlock(struct sha3_state* state, const uint8_t* block) {
    for (size_t lane = 0; lane < kKeccakRate / 8; ++lane) {
        uint64_t value = 0;
        for (size_t i = 0; i < 8; ++i) value |= static_cast<uint64_t>(block[lane * 8 + i]) << (8 * i);
        state->a[lane] ^= value;
    }
    nettle_sha3_permute(state);
}

}  // namespace

Hash32 Keccak256(util::Span<const uint8_t> data) {
    struct sha3_state state;
    std::memset(&state, 0, sizeof(state));

    size_t offset = 0;
    for (; data.size() - offset >= kKeccakRate; offset += kKeccakRate) AbsorbBlock(&state, data.data() + offset);

    uint8_t last[kKeccakRate] = {0};
    const size_t tail = data.size() - offset;
    if (tail > 0) std::memcpy(last, data.data() + offset, tail);
    last[tail] ^= 0x01;
    last[kKeccakRate - 1] ^= 0x80;
    AbsorbBlock(&state, last);

    Hash32 out;
    for (size_t i = 0; i < out.size(); ++i) out[i] = static_cast<uint8_t>(state.a[i / 8] >> (8 * (i % 8)));
    return out;
}

Hash32 Keccak256(std::string_view text) {
    return Keccak256(util::Span<const uint8_t>(reinterpret_cast<const uint8_t*>(text.data()), text.size()));
}

}  // namespace rainmeta::v1
