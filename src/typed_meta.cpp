#include "rainmeta/typed_meta.hpp"

#include <type_traits>

#include "rainmeta/crypto.hpp"

namespace rainmeta::v1 {

namespace {

template <typename T>
util::StatusOr<TypedMeta> Convert(const MetaDocumentItem& item) {
    RAINMETA_ASSIGN_OR_RETURN(T value, MetaPayload<T>::From(item));
    return TypedMeta(std::move(value));
}

}  // namespace

KnownMagic MagicOf(const TypedMeta& meta) {
    return std::visit([](auto&& arg) -> KnownMagic {
        using T = std::decay_t<decltype(arg)>;
        if constexpr (std::is_same_v<T, AuthoringMeta>) return KnownMagic::kAuthoringMetaV1;
        else if constexpr (std::is_same_v<T, AuthoringMetaV2>) return KnownMagic::kAuthoringMetaV2;
        else if constexpr (std::is_same_v<T, DotrainSource>) return KnownMagic::kDotrainSourceV1;
        else if constexpr (std::is_same_v<T, DotrainGuiState>) return KnownMagic::kDotrainGuiStateV1;
        else if constexpr (std::is_same_v<T, ExpressionDeployerBytecodeMeta>) return KnownMagic::kExpressionDeployerV2BytecodeV1;
        else if constexpr (std::is_same_v<T, InterpreterCallerMeta>) return KnownMagic::kInterpreterCallerMetaV1;
        else if constexpr (std::is_same_v<T, OpMeta>) return KnownMagic::kOpMetaV1;
        else if constexpr (std::is_same_v<T, SolidityAbiMeta>) return KnownMagic::kSolidityAbiV2;
        else if constexpr (std::is_same_v<T, AddressListMeta>) return KnownMagic::kAddressList;
        else return T::kMagic;
    }, meta);
}

util::StatusOr<TypedMeta> TypedMetaFromItem(const MetaDocumentItem& item) {
    switch (item.magic) {
        case KnownMagic::kAuthoringMetaV1: return Convert<AuthoringMeta>(item);
        case KnownMagic::kAuthoringMetaV2: {
            auto meta_or = Convert<AuthoringMetaV2>(item);
            if (!meta_or.ok()) return util::Status::UnsupportedMeta("authoring meta v2: " + meta_or.status().message());
            return meta_or;
        }
        case KnownMagic::kDotrainV1: return Convert<DotrainMeta>(item);
        case KnownMagic::kDotrainSourceV1: return Convert<DotrainSource>(item);
        case KnownMagic::kDotrainGuiStateV1: return Convert<DotrainGuiState>(item);
        case KnownMagic::kRainlangV1: return Convert<RainlangMeta>(item);
        case KnownMagic::kRainlangSourceV1: return Convert<RainlangSourceMeta>(item);
        case KnownMagic::kExpressionDeployerV2BytecodeV1: return Convert<ExpressionDeployerBytecodeMeta>(item);
        case KnownMagic::kInterpreterCallerMetaV1: return Convert<InterpreterCallerMeta>(item);
        case KnownMagic::kOpMetaV1: return Convert<OpMeta>(item);
        case KnownMagic::kSolidityAbiV2: return Convert<SolidityAbiMeta>(item);
        case KnownMagic::kAddressList: return Convert<AddressListMeta>(item);
        case KnownMagic::kRainMetaDocumentV1: break;
    }
    return util::Status::UnsupportedMeta(std::string("no typed payload for ") + MagicName(item.magic));
}

util::StatusOr<std::vector<TypedMeta>> ParseFromHex(std::string_view text) {
    RAINMETA_ASSIGN_OR_RETURN(byte_vec bytes, util::HexDecode(text));
    if (!HasMagicPrefix(bytes, KnownMagic::kRainMetaDocumentV1)) {
        return util::Status::CorruptMeta();
    }
    RAINMETA_ASSIGN_OR_RETURN(std::vector<MetaDocumentItem> items, MetaDocumentItem::CborDecode(bytes));

    std::vector<TypedMeta> metas;
    metas.reserve(items.size());
    for (const auto& item : items) {
        RAINMETA_ASSIGN_OR_RETURN(TypedMeta meta, TypedMetaFromItem(item));
        metas.push_back(std::move(meta));
    }
    return metas;
}

}  // namespace rainmeta::v1
