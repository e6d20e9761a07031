// ====================================================================================
// RAINMETA - Content Negotiation
//
// kNone on any of these means the field is absent from the encoded meta map.
// ====================================================================================

#ifndef RAINMETA_CONTENT_HPP_
#define RAINMETA_CONTENT_HPP_

#include <cstdint>
#include <string_view>
#include <vector>

#include "rainmeta/status.hpp"

namespace rainmeta::v1 {

enum class ContentType : uint8_t { kNone = 0, kJson = 1, kCbor = 2, kOctetStream = 3 };
enum class ContentEncoding : uint8_t { kNone = 0, kIdentity = 1, kDeflate = 2 };
enum class ContentLanguage : uint8_t { kNone = 0, kEn = 1 };

// Canonical text forms. kNone has no text form and yields an empty string.
const char* ContentTypeToString(ContentType type);
const char* ContentEncodingToString(ContentEncoding encoding);
const char* ContentLanguageToString(ContentLanguage language);

util::StatusOr<ContentType> ContentTypeFromString(std::string_view text);
util::StatusOr<ContentEncoding> ContentEncodingFromString(std::string_view text);
util::StatusOr<ContentLanguage> ContentLanguageFromString(std::string_view text);

// Identity for kNone/kIdentity. kDeflate produces a zlib-wrapped deflate stream.
util::StatusOr<std::vector<uint8_t>> EncodeContent(ContentEncoding encoding, util::Span<const uint8_t> data);
// kDeflate accepts zlib-wrapped streams and falls back to raw deflate streams.
util::StatusOr<std::vector<uint8_t>> DecodeContent(ContentEncoding encoding, util::Span<const uint8_t> data);

}  // namespace rainmeta::v1

#endif  // RAINMETA_CONTENT_HPP_
