#include "rainmeta/document.hpp"

#include <set>

namespace rainmeta::v1 {

namespace {

// A decoded value that is not shaped like a meta map ends a sequence scan.
bool LooksLikeItem(const cbor::Value& value) {
    return value.is_map() && value.Find(MetaMapKey::kPayload) != nullptr &&
           value.Find(MetaMapKey::kMagic) != nullptr;
}

util::StatusOr<std::string> ExpectText(const cbor::Value& value, const char* field) {
    if (!value.is_text()) return util::Status::CborError(std::string(field) + " must be a text string");
    return value.text();
}

}  // namespace

bool IsUnpackable(KnownMagic magic) {
    switch (magic) {
        case KnownMagic::kOpMetaV1:
        case KnownMagic::kDotrainV1:
        case KnownMagic::kRainlangV1:
        case KnownMagic::kSolidityAbiV2:
        case KnownMagic::kAuthoringMetaV1:
        case KnownMagic::kInterpreterCallerMetaV1:
        case KnownMagic::kExpressionDeployerV2BytecodeV1:
        case KnownMagic::kRainlangSourceV1:
            return true;
        default:
            return false;
    }
}

size_t MetaDocumentItem::FieldCount() const {
    size_t count = 2;
    if (content_type != ContentType::kNone) ++count;
    if (content_encoding != ContentEncoding::kNone) ++count;
    if (content_language != ContentLanguage::kNone) ++count;
    return count;
}

byte_vec MetaDocumentItem::CborEncode() const {
    byte_vec out;
    cbor::Writer writer(&out);
    writer.WriteMapHeader(FieldCount());
    writer.WriteUnsigned(MetaMapKey::kPayload);
    writer.WriteBytes(payload);
    writer.WriteUnsigned(MetaMapKey::kMagic);
    writer.WriteUnsigned(ToU64(magic));
    if (content_type != ContentType::kNone) {
        writer.WriteUnsigned(MetaMapKey::kContentType);
        writer.WriteText(ContentTypeToString(content_type));
    }
    if (content_encoding != ContentEncoding::kNone) {
        writer.WriteUnsigned(MetaMapKey::kContentEncoding);
        writer.WriteText(ContentEncodingToString(content_encoding));
    }
    if (content_language != ContentLanguage::kNone) {
        writer.WriteUnsigned(MetaMapKey::kContentLanguage);
        writer.WriteText(ContentLanguageToString(content_language));
    }
    return out;
}

Hash32 MetaDocumentItem::ItemHash() const {
    return Keccak256(CborEncode());
}

Hash32 MetaDocumentItem::DocumentHash() const {
    return Keccak256(CborEncodeSeq({*this}, KnownMagic::kRainMetaDocumentV1));
}

util::StatusOr<byte_vec> MetaDocumentItem::Unpack() const {
    return DecodeContent(content_encoding, payload);
}

util::StatusOr<MetaDocumentItem> MetaDocumentItem::FromCborValue(const cbor::Value& value) {
    if (!value.is_map()) return util::Status::CborError("meta document item must be a map");
    const size_t size = value.map().size();
    if (size < 2 || size > 5) return util::Status::CborError("meta map must have 2 to 5 entries");

    MetaDocumentItem item;
    bool has_payload = false;
    bool has_magic = false;
    std::set<uint64_t> seen;
    for (const auto& [key, field] : value.map()) {
        if (!key.is_unsigned() || key.integer() > MetaMapKey::kContentLanguage) {
            return util::Status::CborError("unexpected meta map key");
        }
        if (!seen.insert(key.integer()).second) return util::Status::CborError("duplicate meta map key");

        switch (key.integer()) {
            case MetaMapKey::kPayload:
                if (!field.is_bytes()) return util::Status::CborError("payload must be a byte string");
                item.payload = field.bytes();
                has_payload = true;
                break;
            case MetaMapKey::kMagic: {
                if (!field.is_unsigned()) return util::Status::CborError("magic must be an unsigned integer");
                RAINMETA_ASSIGN_OR_RETURN(item.magic, MagicFromU64(field.integer()));
                has_magic = true;
                break;
            }
            case MetaMapKey::kContentType: {
                RAINMETA_ASSIGN_OR_RETURN(std::string text, ExpectText(field, "content type"));
                RAINMETA_ASSIGN_OR_RETURN(item.content_type, ContentTypeFromString(text));
                break;
            }
            case MetaMapKey::kContentEncoding: {
                RAINMETA_ASSIGN_OR_RETURN(std::string text, ExpectText(field, "content encoding"));
                RAINMETA_ASSIGN_OR_RETURN(item.content_encoding, ContentEncodingFromString(text));
                break;
            }
            case MetaMapKey::kContentLanguage: {
                RAINMETA_ASSIGN_OR_RETURN(std::string text, ExpectText(field, "content language"));
                RAINMETA_ASSIGN_OR_RETURN(item.content_language, ContentLanguageFromString(text));
                break;
            }
        }
    }
    if (!has_payload) return util::Status::CborError("missing payload");
    if (!has_magic) return util::Status::CborError("missing magic number");
    return item;
}

byte_vec MetaDocumentItem::CborEncodeSeq(const std::vector<MetaDocumentItem>& items, KnownMagic magic) {
    const auto prefix = ToPrefixBytes(magic);
    byte_vec out(prefix.begin(), prefix.end());
    for (const auto& item : items) {
        const byte_vec encoded = item.CborEncode();
        out.insert(out.end(), encoded.begin(), encoded.end());
    }
    return out;
}

util::StatusOr<std::vector<MetaDocumentItem>> MetaDocumentItem::CborDecode(util::Span<const uint8_t> data) {
    util::Span<const uint8_t> body = data;
    if (HasMagicPrefix(data, KnownMagic::kRainMetaDocumentV1)) body = data.subspan(kMagicPrefixSize);

    cbor::Reader reader(body);
    std::vector<MetaDocumentItem> items;
    std::vector<size_t> offsets;
    while (!reader.AtEnd()) {
        auto value_or = reader.ReadValue();
        if (!value_or.ok() || !LooksLikeItem(value_or.value())) break;
        RAINMETA_ASSIGN_OR_RETURN(MetaDocumentItem item, FromCborValue(value_or.value()));
        items.push_back(std::move(item));
        offsets.push_back(reader.offset());
    }

    if (items.empty() || offsets.empty() || offsets.size() != items.size() || offsets.back() != body.size()) {
        return util::Status::CorruptMeta();
    }
    return items;
}

bool MetaDocumentItem::operator==(const MetaDocumentItem& other) const {
    return payload == other.payload && magic == other.magic && content_type == other.content_type &&
           content_encoding == other.content_encoding && content_language == other.content_language;
}

util::StatusOr<std::string> Utf8FromBytes(util::Span<const uint8_t> bytes) {
    size_t i = 0;
    while (i < bytes.size()) {
        const uint8_t lead = bytes[i];
        size_t extra;
        uint32_t code_point;
        if (lead < 0x80) {
            ++i;
            continue;
        } else if ((lead & 0xe0) == 0xc0) {
            extra = 1;
            code_point = lead & 0x1f;
        } else if ((lead & 0xf0) == 0xe0) {
            extra = 2;
            code_point = lead & 0x0f;
        } else if ((lead & 0xf8) == 0xf0) {
            extra = 3;
            code_point = lead & 0x07;
        } else {
            return util::Status::Utf8Error("invalid utf-8 lead byte at offset " + std::to_string(i));
        }
        if (bytes.size() - i <= extra) return util::Status::Utf8Error("truncated utf-8 sequence");
        for (size_t k = 1; k <= extra; ++k) {
            const uint8_t next = bytes[i + k];
            if ((next & 0xc0) != 0x80) return util::Status::Utf8Error("invalid utf-8 continuation byte");
            code_point = (code_point << 6) | (next & 0x3f);
        }
        static const uint32_t kMinForLength[] = {0, 0x80, 0x800, 0x10000};
        if (code_point < kMinForLength[extra]) return util::Status::Utf8Error("overlong utf-8 encoding");
        if (code_point > 0x10ffff || (code_point >= 0xd800 && code_point <= 0xdfff)) {
            return util::Status::Utf8Error("invalid utf-8 code point");
        }
        i += extra + 1;
    }
    return std::string(bytes.begin(), bytes.end());
}

util::StatusOr<std::string> MetaPayload<std::string>::From(const MetaDocumentItem& item) {
    RAINMETA_ASSIGN_OR_RETURN(byte_vec bytes, item.Unpack());
    return Utf8FromBytes(bytes);
}

}  // namespace rainmeta::v1
