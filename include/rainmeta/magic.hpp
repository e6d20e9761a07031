// ====================================================================================
// RAINMETA - Magic Registry
//
// Every Rain meta payload is tagged with a 64-bit magic number whose high byte is
// 0xff. The big-endian form doubles as the literal prefix of an encoded sequence.
// ====================================================================================

#ifndef RAINMETA_MAGIC_HPP_
#define RAINMETA_MAGIC_HPP_

#include <array>
#include <cstdint>
#include <string_view>
#include <vector>

#include "rainmeta/status.hpp"

namespace rainmeta::v1 {

enum class KnownMagic : uint64_t {
    kOpMetaV1 = 0xffe5282f43e495b4ULL,
    kDotrainV1 = 0xffdac2f2f37be894ULL,
    kRainlangV1 = 0xff1c198cec3b48a7ULL,
    kSolidityAbiV2 = 0xffe5ffb4a3ff2cdeULL,
    kAuthoringMetaV1 = 0xffe9e3a02ca8e235ULL,
    kAuthoringMetaV2 = 0xff52fe42f1a05093ULL,
    kRainMetaDocumentV1 = 0xff0a89c674ee7874ULL,
    kInterpreterCallerMetaV1 = 0xffc21bbf86cc199bULL,
    kExpressionDeployerV2BytecodeV1 = 0xffdb988a8cd04d32ULL,
    kRainlangSourceV1 = 0xff13109e41336ff2ULL,
    kAddressList = 0xffb2637608c09e38ULL,
    kDotrainSourceV1 = 0xffa15ef0fc437099ULL,
    kDotrainGuiStateV1 = 0xffda7b2fb167c286ULL
};

constexpr size_t kMagicPrefixSize = 8;

inline uint64_t ToU64(KnownMagic magic) { return static_cast<uint64_t>(magic); }

std::array<uint8_t, kMagicPrefixSize> ToPrefixBytes(KnownMagic magic);
util::StatusOr<KnownMagic> MagicFromU64(uint64_t value);

const char* MagicName(KnownMagic magic);
util::StatusOr<KnownMagic> MagicFromName(std::string_view name);
const std::vector<KnownMagic>& AllKnownMagics();

bool HasMagicPrefix(util::Span<const uint8_t> bytes, KnownMagic magic);

}  // namespace rainmeta::v1

#endif  // RAINMETA_MAGIC_HPP_
