#include "rainmeta/types.hpp"

#include <algorithm>

#include "rainmeta/abi.hpp"

namespace rainmeta::v1 {

namespace {

constexpr size_t kAddressSize = 20;

util::Status ParseJson(std::string_view text, nlohmann::json* out) {
    *out = nlohmann::json::parse(text.begin(), text.end(), nullptr, false);
    if (out->is_discarded()) return util::Status::JsonError("malformed json");
    return util::Status::Ok();
}

bool HasStringField(const nlohmann::json& object, const char* key) {
    return object.is_object() && object.contains(key) && object[key].is_string();
}

util::StatusOr<MetaDocumentItem> JsonDocumentItem(const nlohmann::json& json, KnownMagic magic,
                                                  ContentEncoding encoding) {
    const std::string text = json.dump();
    RAINMETA_ASSIGN_OR_RETURN(
        byte_vec payload,
        EncodeContent(encoding, util::Span<const uint8_t>(reinterpret_cast<const uint8_t*>(text.data()), text.size())));
    return MetaDocumentItem{std::move(payload), magic, ContentType::kJson, encoding, ContentLanguage::kEn};
}

// Offset word, length word, per-element head offsets, then the element tails.
byte_vec EncodeTupleArray(const std::vector<byte_vec>& tuples) {
    byte_vec out;
    abi::AppendUint(&out, abi::kWordSize);
    abi::AppendUint(&out, tuples.size());
    size_t offset = tuples.size() * abi::kWordSize;
    for (const auto& tuple : tuples) {
        abi::AppendUint(&out, offset);
        offset += tuple.size();
    }
    for (const auto& tuple : tuples) out.insert(out.end(), tuple.begin(), tuple.end());
    return out;
}

// Returns the absolute start of every tuple in an ABI encoded dynamic tuple array.
util::StatusOr<std::vector<size_t>> DecodeTupleArrayHeads(const abi::Decoder& decoder) {
    RAINMETA_ASSIGN_OR_RETURN(uint64_t base, decoder.UintAt(0));
    RAINMETA_ASSIGN_OR_RETURN(uint64_t count, decoder.UintAt(base));
    const size_t heads = base + abi::kWordSize;
    if (count > (decoder.size() - heads) / abi::kWordSize) return util::Status::AbiError("array length exceeds input");

    std::vector<size_t> starts;
    starts.reserve(count);
    for (uint64_t i = 0; i < count; ++i) {
        RAINMETA_ASSIGN_OR_RETURN(uint64_t relative, decoder.UintAt(heads + i * abi::kWordSize));
        if (relative > decoder.size()) return util::Status::AbiError("tuple offset out of bounds");
        starts.push_back(heads + relative);
    }
    return starts;
}

util::StatusOr<std::string> DecodeAbiString(const abi::Decoder& decoder, size_t tuple_start, size_t head_offset) {
    RAINMETA_ASSIGN_OR_RETURN(uint64_t relative, decoder.UintAt(tuple_start + head_offset));
    if (relative > decoder.size()) return util::Status::AbiError("string offset out of bounds");
    RAINMETA_ASSIGN_OR_RETURN(byte_vec bytes, decoder.DynamicBytesAt(tuple_start + relative));
    return Utf8FromBytes(bytes);
}

util::Span<const uint8_t> AsBytes(const std::string& text) {
    return util::Span<const uint8_t>(reinterpret_cast<const uint8_t*>(text.data()), text.size());
}

}  // namespace

util::Status ExpectMagic(const MetaDocumentItem& item, KnownMagic expected) {
    if (item.magic != expected) return util::Status::InvalidMetaMagic(MagicName(expected), MagicName(item.magic));
    return util::Status::Ok();
}

// ==== SECTION 1: Authoring Meta ====

util::Status ValidateWord(std::string_view word) {
    if (word.empty() || word.size() > kHashSize) {
        return util::Status::AbiError("word '" + std::string(word) + "' must be 1 to 32 bytes");
    }
    if (word[0] < 'a' || word[0] > 'z') {
        return util::Status::AbiError("word '" + std::string(word) + "' must start with a lowercase letter");
    }
    for (char c : word) {
        const bool allowed = (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '-';
        if (!allowed) return util::Status::AbiError("word '" + std::string(word) + "' has an invalid character");
    }
    return util::Status::Ok();
}

util::Status AuthoringMeta::Validate() const {
    for (const auto& item : items) RAINMETA_RETURN_IF_ERROR(ValidateWord(item.word));
    return util::Status::Ok();
}

util::StatusOr<byte_vec> AuthoringMeta::AbiEncodeValidate() const {
    RAINMETA_RETURN_IF_ERROR(Validate());
    std::vector<byte_vec> tuples;
    for (const auto& item : items) {
        RAINMETA_ASSIGN_OR_RETURN(Hash32 word, StrToBytes32(item.word));
        byte_vec tuple;
        abi::AppendWord(&tuple, word);
        abi::AppendUint(&tuple, item.operand_parser_offset);
        abi::AppendUint(&tuple, 3 * abi::kWordSize);
        abi::AppendDynamicBytes(&tuple, AsBytes(item.description));
        tuples.push_back(std::move(tuple));
    }
    return EncodeTupleArray(tuples);
}

util::StatusOr<AuthoringMeta> AuthoringMeta::AbiDecodeValidate(util::Span<const uint8_t> data) {
    abi::Decoder decoder(data);
    RAINMETA_ASSIGN_OR_RETURN(std::vector<size_t> starts, DecodeTupleArrayHeads(decoder));

    AuthoringMeta meta;
    for (size_t start : starts) {
        AuthoringMetaItem item;
        RAINMETA_ASSIGN_OR_RETURN(Hash32 word, decoder.WordAt(start));
        RAINMETA_ASSIGN_OR_RETURN(item.word, Bytes32ToStr(word));
        RAINMETA_ASSIGN_OR_RETURN(uint64_t offset, decoder.UintAt(start + abi::kWordSize, 8));
        item.operand_parser_offset = static_cast<uint8_t>(offset);
        RAINMETA_ASSIGN_OR_RETURN(item.description, DecodeAbiString(decoder, start, 2 * abi::kWordSize));
        meta.items.push_back(std::move(item));
    }
    RAINMETA_RETURN_IF_ERROR(meta.Validate());
    return meta;
}

util::StatusOr<AuthoringMeta> AuthoringMeta::FromJson(std::string_view text) {
    nlohmann::json json;
    RAINMETA_RETURN_IF_ERROR(ParseJson(text, &json));
    if (!json.is_array()) return util::Status::JsonError("authoring meta must be a json array");

    AuthoringMeta meta;
    for (const auto& entry : json) {
        if (!HasStringField(entry, "word") || !HasStringField(entry, "description")) {
            return util::Status::JsonError("authoring meta entry needs string word and description");
        }
        if (!entry.contains("operandParserOffset") || !entry["operandParserOffset"].is_number_unsigned() ||
            entry["operandParserOffset"].get<uint64_t>() > 0xff) {
            return util::Status::JsonError("operandParserOffset must be an integer between 0 and 255");
        }
        meta.items.push_back({entry["word"].get<std::string>(),
                              static_cast<uint8_t>(entry["operandParserOffset"].get<uint64_t>()),
                              entry["description"].get<std::string>()});
    }
    return meta;
}

nlohmann::json AuthoringMeta::ToJson() const {
    nlohmann::json json = nlohmann::json::array();
    for (const auto& item : items) {
        json.push_back({{"word", item.word},
                        {"description", item.description},
                        {"operandParserOffset", item.operand_parser_offset}});
    }
    return json;
}

util::StatusOr<MetaDocumentItem> AuthoringMeta::ToDocumentItem() const {
    RAINMETA_ASSIGN_OR_RETURN(byte_vec payload, AbiEncodeValidate());
    return MetaDocumentItem{std::move(payload), KnownMagic::kAuthoringMetaV1, ContentType::kCbor};
}

util::StatusOr<byte_vec> AuthoringMetaV2::AbiEncodeValidate() const {
    std::vector<byte_vec> tuples;
    for (const auto& item : items) {
        RAINMETA_RETURN_IF_ERROR(ValidateWord(item.word));
        RAINMETA_ASSIGN_OR_RETURN(Hash32 word, StrToBytes32(item.word));
        byte_vec tuple;
        abi::AppendWord(&tuple, word);
        abi::AppendUint(&tuple, 2 * abi::kWordSize);
        abi::AppendDynamicBytes(&tuple, AsBytes(item.description));
        tuples.push_back(std::move(tuple));
    }
    return EncodeTupleArray(tuples);
}

util::StatusOr<AuthoringMetaV2> AuthoringMetaV2::AbiDecodeValidate(util::Span<const uint8_t> data) {
    abi::Decoder decoder(data);
    RAINMETA_ASSIGN_OR_RETURN(std::vector<size_t> starts, DecodeTupleArrayHeads(decoder));

    AuthoringMetaV2 meta;
    for (size_t start : starts) {
        AuthoringMetaV2Item item;
        RAINMETA_ASSIGN_OR_RETURN(Hash32 word, decoder.WordAt(start));
        RAINMETA_ASSIGN_OR_RETURN(item.word, Bytes32ToStr(word));
        RAINMETA_RETURN_IF_ERROR(ValidateWord(item.word));
        RAINMETA_ASSIGN_OR_RETURN(item.description, DecodeAbiString(decoder, start, abi::kWordSize));
        meta.items.push_back(std::move(item));
    }
    return meta;
}

util::StatusOr<MetaDocumentItem> AuthoringMetaV2::ToDocumentItem() const {
    RAINMETA_ASSIGN_OR_RETURN(byte_vec payload, AbiEncodeValidate());
    return MetaDocumentItem{std::move(payload), KnownMagic::kAuthoringMetaV2, ContentType::kOctetStream};
}

// ==== SECTION 2: JSON Payloads ====

util::StatusOr<OpMeta> OpMeta::FromJson(std::string_view text) {
    OpMeta meta;
    RAINMETA_RETURN_IF_ERROR(ParseJson(text, &meta.ops));
    if (!meta.ops.is_array()) return util::Status::JsonError("op meta must be a json array");
    for (const auto& op : meta.ops) {
        if (!HasStringField(op, "name") || !HasStringField(op, "desc")) {
            return util::Status::JsonError("op meta entry needs string name and desc");
        }
    }
    return meta;
}

util::StatusOr<MetaDocumentItem> OpMeta::ToDocumentItem(ContentEncoding encoding) const {
    return JsonDocumentItem(ops, KnownMagic::kOpMetaV1, encoding);
}

util::StatusOr<SolidityAbiMeta> SolidityAbiMeta::FromJson(std::string_view text) {
    SolidityAbiMeta meta;
    RAINMETA_RETURN_IF_ERROR(ParseJson(text, &meta.abi));
    if (!meta.abi.is_array()) return util::Status::JsonError("solidity abi must be a json array");
    for (const auto& fragment : meta.abi) {
        if (!HasStringField(fragment, "type")) return util::Status::JsonError("abi fragment needs a string type");
    }
    return meta;
}

util::StatusOr<MetaDocumentItem> SolidityAbiMeta::ToDocumentItem(ContentEncoding encoding) const {
    return JsonDocumentItem(abi, KnownMagic::kSolidityAbiV2, encoding);
}

util::StatusOr<InterpreterCallerMeta> InterpreterCallerMeta::FromJson(std::string_view text) {
    InterpreterCallerMeta meta;
    RAINMETA_RETURN_IF_ERROR(ParseJson(text, &meta.meta));
    if (!HasStringField(meta.meta, "name")) return util::Status::JsonError("caller meta needs a string name");
    return meta;
}

util::StatusOr<MetaDocumentItem> InterpreterCallerMeta::ToDocumentItem(ContentEncoding encoding) const {
    return JsonDocumentItem(meta, KnownMagic::kInterpreterCallerMetaV1, encoding);
}

// ==== SECTION 3: Raw Payloads ====

util::StatusOr<std::vector<Address>> AddressListMeta::Addresses() const {
    if (packed.size() % kAddressSize != 0) return util::Status::AbiError("address list is not a multiple of 20 bytes");
    std::vector<Address> addresses(packed.size() / kAddressSize);
    for (size_t i = 0; i < addresses.size(); ++i) {
        std::copy(packed.begin() + i * kAddressSize, packed.begin() + (i + 1) * kAddressSize, addresses[i].begin());
    }
    return addresses;
}

AddressListMeta AddressListMeta::FromAddresses(const std::vector<Address>& addresses) {
    AddressListMeta meta;
    for (const auto& address : addresses) meta.packed.insert(meta.packed.end(), address.begin(), address.end());
    return meta;
}

// ==== SECTION 4: MetaPayload conversions ====

util::StatusOr<AuthoringMeta> MetaPayload<AuthoringMeta>::From(const MetaDocumentItem& item) {
    RAINMETA_RETURN_IF_ERROR(ExpectMagic(item, KnownMagic::kAuthoringMetaV1));
    RAINMETA_ASSIGN_OR_RETURN(byte_vec bytes, item.Unpack());
    return AuthoringMeta::AbiDecodeValidate(bytes);
}

util::StatusOr<AuthoringMetaV2> MetaPayload<AuthoringMetaV2>::From(const MetaDocumentItem& item) {
    RAINMETA_RETURN_IF_ERROR(ExpectMagic(item, KnownMagic::kAuthoringMetaV2));
    RAINMETA_ASSIGN_OR_RETURN(byte_vec bytes, item.Unpack());
    return AuthoringMetaV2::AbiDecodeValidate(bytes);
}

util::StatusOr<OpMeta> MetaPayload<OpMeta>::From(const MetaDocumentItem& item) {
    RAINMETA_RETURN_IF_ERROR(ExpectMagic(item, KnownMagic::kOpMetaV1));
    RAINMETA_ASSIGN_OR_RETURN(std::string text, MetaPayload<std::string>::From(item));
    return OpMeta::FromJson(text);
}

util::StatusOr<SolidityAbiMeta> MetaPayload<SolidityAbiMeta>::From(const MetaDocumentItem& item) {
    RAINMETA_RETURN_IF_ERROR(ExpectMagic(item, KnownMagic::kSolidityAbiV2));
    RAINMETA_ASSIGN_OR_RETURN(std::string text, MetaPayload<std::string>::From(item));
    return SolidityAbiMeta::FromJson(text);
}

util::StatusOr<InterpreterCallerMeta> MetaPayload<InterpreterCallerMeta>::From(const MetaDocumentItem& item) {
    RAINMETA_RETURN_IF_ERROR(ExpectMagic(item, KnownMagic::kInterpreterCallerMetaV1));
    RAINMETA_ASSIGN_OR_RETURN(std::string text, MetaPayload<std::string>::From(item));
    return InterpreterCallerMeta::FromJson(text);
}

util::StatusOr<ExpressionDeployerBytecodeMeta> MetaPayload<ExpressionDeployerBytecodeMeta>::From(
    const MetaDocumentItem& item) {
    RAINMETA_RETURN_IF_ERROR(ExpectMagic(item, KnownMagic::kExpressionDeployerV2BytecodeV1));
    RAINMETA_ASSIGN_OR_RETURN(byte_vec bytes, item.Unpack());
    return ExpressionDeployerBytecodeMeta{std::move(bytes)};
}

util::StatusOr<AddressListMeta> MetaPayload<AddressListMeta>::From(const MetaDocumentItem& item) {
    RAINMETA_RETURN_IF_ERROR(ExpectMagic(item, KnownMagic::kAddressList));
    RAINMETA_ASSIGN_OR_RETURN(byte_vec bytes, item.Unpack());
    AddressListMeta meta{std::move(bytes)};
    RAINMETA_RETURN_IF_ERROR(meta.Addresses().status());
    return meta;
}

util::StatusOr<DotrainSource> MetaPayload<DotrainSource>::From(const MetaDocumentItem& item) {
    RAINMETA_RETURN_IF_ERROR(ExpectMagic(item, KnownMagic::kDotrainSourceV1));
    RAINMETA_ASSIGN_OR_RETURN(std::string text, MetaPayload<std::string>::From(item));
    return DotrainSource{std::move(text)};
}

util::StatusOr<DotrainGuiState> MetaPayload<DotrainGuiState>::From(const MetaDocumentItem& item) {
    return DotrainGuiState::FromDocumentItem(item);
}

}  // namespace rainmeta::v1
