// ====================================================================================
// RAINMETA - Typed Meta Registry
// ====================================================================================

#ifndef RAINMETA_TYPED_META_HPP_
#define RAINMETA_TYPED_META_HPP_

#include <string_view>
#include <variant>
#include <vector>

#include "rainmeta/types.hpp"

namespace rainmeta::v1 {

using TypedMeta = std::variant<
    AuthoringMeta,
    AuthoringMetaV2,
    DotrainMeta,
    DotrainSource,
    DotrainGuiState,
    RainlangMeta,
    RainlangSourceMeta,
    ExpressionDeployerBytecodeMeta,
    InterpreterCallerMeta,
    OpMeta,
    SolidityAbiMeta,
    AddressListMeta>;

KnownMagic MagicOf(const TypedMeta& meta);

// Dispatches on item.magic alone.
util::StatusOr<TypedMeta> TypedMetaFromItem(const MetaDocumentItem& item);

// Hex ("0x" optional) of a RainMetaDocumentV1 sequence. Fails on the first item
// that does not convert.
util::StatusOr<std::vector<TypedMeta>> ParseFromHex(std::string_view text);

}  // namespace rainmeta::v1

#endif  // RAINMETA_TYPED_META_HPP_
