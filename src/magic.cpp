#include "rainmeta/magic.hpp"

#include <cstring>
#include <iomanip>
#include <sstream>
#include <string>

namespace rainmeta::v1 {

std::array<uint8_t, kMagicPrefixSize> ToPrefixBytes(KnownMagic magic) {
    std::array<uint8_t, kMagicPrefixSize> bytes{};
    const uint64_t value = ToU64(magic);
    for (size_t i = 0; i < kMagicPrefixSize; ++i) {
        bytes[i] = (value >> (8 * (kMagicPrefixSize - 1 - i))) & 0xFF;
    }
    return bytes;
}

const std::vector<KnownMagic>& AllKnownMagics() {
    static const std::vector<KnownMagic> magics = {
        KnownMagic::kOpMetaV1,
        KnownMagic::kDotrainV1,
        KnownMagic::kRainlangV1,
        KnownMagic::kSolidityAbiV2,
        KnownMagic::kAuthoringMetaV1,
        KnownMagic::kAuthoringMetaV2,
        KnownMagic::kRainMetaDocumentV1,
        KnownMagic::kInterpreterCallerMetaV1,
        KnownMagic::kExpressionDeployerV2BytecodeV1,
        KnownMagic::kRainlangSourceV1,
        KnownMagic::kAddressList,
        KnownMagic::kDotrainSourceV1,
        KnownMagic::kDotrainGuiStateV1,
    };
    return magics;
}

util::StatusOr<KnownMagic> MagicFromU64(uint64_t value) {
    for (KnownMagic magic : AllKnownMagics()) {
        if (ToU64(magic) == value) return magic;
    }
    std::ostringstream oss;
    oss << "unknown magic 0x" << std::hex << std::setfill('0') << std::setw(16) << value;
    return util::Status::UnknownMagic(oss.str());
}

const char* MagicName(KnownMagic magic) {
    switch (magic) {
        case KnownMagic::kOpMetaV1: return "op-meta-v1";
        case KnownMagic::kDotrainV1: return "dotrain-v1";
        case KnownMagic::kRainlangV1: return "rainlang-v1";
        case KnownMagic::kSolidityAbiV2: return "solidity-abi-v2";
        case KnownMagic::kAuthoringMetaV1: return "authoring-meta-v1";
        case KnownMagic::kAuthoringMetaV2: return "authoring-meta-v2";
        case KnownMagic::kRainMetaDocumentV1: return "rain-meta-document-v1";
        case KnownMagic::kInterpreterCallerMetaV1: return "interpreter-caller-meta-v1";
        case KnownMagic::kExpressionDeployerV2BytecodeV1: return "expression-deployer-v2-bytecode-v1";
        case KnownMagic::kRainlangSourceV1: return "rainlang-source-v1";
        case KnownMagic::kAddressList: return "address-list";
        case KnownMagic::kDotrainSourceV1: return "dotrain-source-v1";
        case KnownMagic::kDotrainGuiStateV1: return "dotrain-gui-state-v1";
    }
    return "unknown";
}

util::StatusOr<KnownMagic> MagicFromName(std::string_view name) {
    for (KnownMagic magic : AllKnownMagics()) {
        if (name == MagicName(magic)) return magic;
    }
    return util::Status::UnknownMagic("unknown magic name: " + std::string(name));
}

bool HasMagicPrefix(util::Span<const uint8_t> bytes, KnownMagic magic) {
    if (bytes.size() < kMagicPrefixSize) return false;
    const auto prefix = ToPrefixBytes(magic);
    return std::memcmp(bytes.data(), prefix.data(), kMagicPrefixSize) == 0;
}

}  // namespace rainmeta::v1
