// ====================================================================================
// RAINMETA - Meta Document Codec
//
// A meta document item is a CBOR map with integer keys:
//   0 payload (bytes), 1 magic (uint), 2 content type, 3 content encoding,
//   4 content language (text, each omitted when kNone).
// A sequence is the 8-byte magic prefix followed by concatenated item maps.
// ====================================================================================

#ifndef RAINMETA_DOCUMENT_HPP_
#define RAINMETA_DOCUMENT_HPP_

#include <cstdint>
#include <string>
#include <vector>

#include "rainmeta/cbor.hpp"
#include "rainmeta/content.hpp"
#include "rainmeta/crypto.hpp"
#include "rainmeta/magic.hpp"
#include "rainmeta/status.hpp"

namespace rainmeta::v1 {

namespace MetaMapKey {
  constexpr uint64_t kPayload = 0;
  constexpr uint64_t kMagic = 1;
  constexpr uint64_t kContentType = 2;
  constexpr uint64_t kContentEncoding = 3;
  constexpr uint64_t kContentLanguage = 4;
}  // namespace MetaMapKey

// Specialized per payload type: static util::StatusOr<T> From(const MetaDocumentItem&).
template <typename T>
struct MetaPayload;

// Magics UnpackInto accepts: OpMetaV1, DotrainV1, RainlangV1, SolidityAbiV2,
// AuthoringMetaV1, InterpreterCallerMetaV1, ExpressionDeployerV2BytecodeV1 and
// RainlangSourceV1. Everything else fails with UnsupportedMeta. The typed registry
// converts the remaining payload magics through MetaPayload<T>::From directly.
bool IsUnpackable(KnownMagic magic);

struct MetaDocumentItem {
    byte_vec payload;
    KnownMagic magic = KnownMagic::kRainMetaDocumentV1;
    ContentType content_type = ContentType::kNone;
    ContentEncoding content_encoding = ContentEncoding::kNone;
    ContentLanguage content_language = ContentLanguage::kNone;

    size_t FieldCount() const;

    byte_vec CborEncode() const;
    // keccak256 of CborEncode().
    Hash32 ItemHash() const;
    // keccak256 of the one-item RainMetaDocumentV1 sequence.
    Hash32 DocumentHash() const;

    // Payload with the content encoding removed.
    util::StatusOr<byte_vec> Unpack() const;
    template <typename T>
    util::StatusOr<T> UnpackInto() const;

    static util::StatusOr<MetaDocumentItem> FromCborValue(const cbor::Value& value);
    static byte_vec CborEncodeSeq(const std::vector<MetaDocumentItem>& items, KnownMagic magic);
    static util::StatusOr<std::vector<MetaDocumentItem>> CborDecode(util::Span<const uint8_t> data);

    bool operator==(const MetaDocumentItem& other) const;
    bool operator!=(const MetaDocumentItem& other) const { return !(*this == other); }
};

template <typename T>
util::StatusOr<T> MetaDocumentItem::UnpackInto() const {
    if (!IsUnpackable(magic)) {
        return util::Status::UnsupportedMeta(std::string("no typed payload for ") + MagicName(magic));
    }
    return MetaPayload<T>::From(*this);
}

util::StatusOr<std::string> Utf8FromBytes(util::Span<const uint8_t> bytes);

template <>
struct MetaPayload<std::string> {
    static util::StatusOr<std::string> From(const MetaDocumentItem& item);
};

template <>
struct MetaPayload<byte_vec> {
    static util::StatusOr<byte_vec> From(const MetaDocumentItem& item) { return item.Unpack(); }
};

}  // namespace rainmeta::v1

#endif  // RAINMETA_DOCUMENT_HPP_
