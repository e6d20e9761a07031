// ====================================================================================
// RAINMETA - Typed Payloads
//
// One struct per known payload. Each converts from a document item through
// MetaPayload<T>::From and, where it is authored locally, back via ToDocumentItem.
// ====================================================================================

#ifndef RAINMETA_TYPES_HPP_
#define RAINMETA_TYPES_HPP_

#include <array>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "rainmeta/document.hpp"

namespace rainmeta::v1 {

using Address = std::array<uint8_t, 20>;

util::Status ExpectMagic(const MetaDocumentItem& item, KnownMagic expected);

// --- Authoring Meta ---

struct AuthoringMetaItem {
    std::string word;
    uint8_t operand_parser_offset = 0;
    std::string description;
    bool operator==(const AuthoringMetaItem& other) const {
        return word == other.word && operand_parser_offset == other.operand_parser_offset &&
               description == other.description;
    }
};

// Words must match ^[a-z][0-9a-z-]*$ and fit in a bytes32.
util::Status ValidateWord(std::string_view word);

// ABI (bytes32 word, uint8 operandParserOffset, string description)[]
struct AuthoringMeta {
    std::vector<AuthoringMetaItem> items;

    util::Status Validate() const;
    util::StatusOr<byte_vec> AbiEncodeValidate() const;
    static util::StatusOr<AuthoringMeta> AbiDecodeValidate(util::Span<const uint8_t> data);

    // [{"word": .., "description": .., "operandParserOffset": ..}, ...]
    static util::StatusOr<AuthoringMeta> FromJson(std::string_view text);
    nlohmann::json ToJson() const;

    util::StatusOr<MetaDocumentItem> ToDocumentItem() const;
    bool operator==(const AuthoringMeta& other) const { return items == other.items; }
};

struct AuthoringMetaV2Item {
    std::string word;
    std::string description;
    bool operator==(const AuthoringMetaV2Item& other) const {
        return word == other.word && description == other.description;
    }
};

// ABI (bytes32 word, string description)[]
struct AuthoringMetaV2 {
    std::vector<AuthoringMetaV2Item> items;

    util::StatusOr<byte_vec> AbiEncodeValidate() const;
    static util::StatusOr<AuthoringMetaV2> AbiDecodeValidate(util::Span<const uint8_t> data);
    util::StatusOr<MetaDocumentItem> ToDocumentItem() const;
    bool operator==(const AuthoringMetaV2& other) const { return items == other.items; }
};

// --- JSON Payloads ---

// Array of opcode descriptions, each an object with string "name" and "desc".
struct OpMeta {
    nlohmann::json ops;
    static util::StatusOr<OpMeta> FromJson(std::string_view text);
    util::StatusOr<MetaDocumentItem> ToDocumentItem(ContentEncoding encoding = ContentEncoding::kDeflate) const;
    bool operator==(const OpMeta& other) const { return ops == other.ops; }
};

// Solidity ABI JSON: array of fragments with a string "type".
struct SolidityAbiMeta {
    nlohmann::json abi;
    static util::StatusOr<SolidityAbiMeta> FromJson(std::string_view text);
    util::StatusOr<MetaDocumentItem> ToDocumentItem(ContentEncoding encoding = ContentEncoding::kDeflate) const;
    bool operator==(const SolidityAbiMeta& other) const { return abi == other.abi; }
};

// Object with at least a string "name".
struct InterpreterCallerMeta {
    nlohmann::json meta;
    static util::StatusOr<InterpreterCallerMeta> FromJson(std::string_view text);
    util::StatusOr<MetaDocumentItem> ToDocumentItem(ContentEncoding encoding = ContentEncoding::kDeflate) const;
    bool operator==(const InterpreterCallerMeta& other) const { return meta == other.meta; }
};

// --- Text & Raw Payloads ---

template <KnownMagic M>
struct TextMeta {
    static constexpr KnownMagic kMagic = M;
    std::string text;

    MetaDocumentItem ToDocumentItem() const {
        return MetaDocumentItem{byte_vec(text.begin(), text.end()), M, ContentType::kOctetStream};
    }
    bool operator==(const TextMeta& other) const { return text == other.text; }
};

using DotrainMeta = TextMeta<KnownMagic::kDotrainV1>;
using RainlangMeta = TextMeta<KnownMagic::kRainlangV1>;
using RainlangSourceMeta = TextMeta<KnownMagic::kRainlangSourceV1>;

struct ExpressionDeployerBytecodeMeta {
    byte_vec bytecode;
    MetaDocumentItem ToDocumentItem() const {
        return MetaDocumentItem{bytecode, KnownMagic::kExpressionDeployerV2BytecodeV1, ContentType::kOctetStream};
    }
    bool operator==(const ExpressionDeployerBytecodeMeta& other) const { return bytecode == other.bytecode; }
};

// Packed 20-byte addresses.
struct AddressListMeta {
    byte_vec packed;
    util::StatusOr<std::vector<Address>> Addresses() const;
    static AddressListMeta FromAddresses(const std::vector<Address>& addresses);
    MetaDocumentItem ToDocumentItem() const {
        return MetaDocumentItem{packed, KnownMagic::kAddressList, ContentType::kOctetStream};
    }
    bool operator==(const AddressListMeta& other) const { return packed == other.packed; }
};

// --- Dotrain Source ---

struct DotrainSource {
    std::string text;

    // keccak256 of the raw text, not of the encoded item.
    Hash32 Hash() const { return Keccak256(std::string_view(text)); }
    MetaDocumentItem ToDocumentItem() const {
        return MetaDocumentItem{byte_vec(text.begin(), text.end()), KnownMagic::kDotrainSourceV1,
                                ContentType::kOctetStream};
    }
    bool operator==(const DotrainSource& other) const { return text == other.text; }
};

// --- Dotrain GUI State ---

struct ValueCfg {
    std::string id;
    std::optional<std::string> name;
    std::string value;
    bool operator==(const ValueCfg& other) const {
        return id == other.id && name == other.name && value == other.value;
    }
};

struct TokenCfg {
    std::string network;
    Address address{};
    bool operator==(const TokenCfg& other) const { return network == other.network && address == other.address; }
};

struct DotrainGuiState {
    Hash32 dotrain_hash{};
    std::map<std::string, ValueCfg> field_values;
    std::map<std::string, ValueCfg> deposits;
    std::map<std::string, TokenCfg> select_tokens;
    std::map<std::string, std::optional<std::string>> vault_ids;
    std::string selected_deployment;

    std::vector<Address> TokenAddresses() const;
    std::vector<std::string> VaultIds() const;

    byte_vec CborEncodePayload() const;
    static util::StatusOr<DotrainGuiState> CborDecodePayload(util::Span<const uint8_t> data);

    MetaDocumentItem ToDocumentItem() const;
    static util::StatusOr<DotrainGuiState> FromDocumentItem(const MetaDocumentItem& item);
    // Finds the first gui state item, descending into nested RainMetaDocumentV1 payloads.
    static util::StatusOr<std::optional<DotrainGuiState>> ExtractFromMeta(util::Span<const uint8_t> data);

    bool operator==(const DotrainGuiState& other) const;
};

// --- MetaPayload conversions ---

template <KnownMagic M>
struct MetaPayload<TextMeta<M>> {
    static util::StatusOr<TextMeta<M>> From(const MetaDocumentItem& item) {
        RAINMETA_RETURN_IF_ERROR(ExpectMagic(item, M));
        RAINMETA_ASSIGN_OR_RETURN(std::string text, MetaPayload<std::string>::From(item));
        return TextMeta<M>{std::move(text)};
    }
};

template <> struct MetaPayload<AuthoringMeta> { static util::StatusOr<AuthoringMeta> From(const MetaDocumentItem& item); };
template <> struct MetaPayload<AuthoringMetaV2> { static util::StatusOr<AuthoringMetaV2> From(const MetaDocumentItem& item); };
template <> struct MetaPayload<OpMeta> { static util::StatusOr<OpMeta> From(const MetaDocumentItem& item); };
template <> struct MetaPayload<SolidityAbiMeta> { static util::StatusOr<SolidityAbiMeta> From(const MetaDocumentItem& item); };
template <> struct MetaPayload<InterpreterCallerMeta> { static util::StatusOr<InterpreterCallerMeta> From(const MetaDocumentItem& item); };
template <> struct MetaPayload<ExpressionDeployerBytecodeMeta> { static util::StatusOr<ExpressionDeployerBytecodeMeta> From(const MetaDocumentItem& item); };
template <> struct MetaPayload<AddressListMeta> { static util::StatusOr<AddressListMeta> From(const MetaDocumentItem& item); };
template <> struct MetaPayload<DotrainSource> { static util::StatusOr<DotrainSource> From(const MetaDocumentItem& item); };
template <> struct MetaPayload<DotrainGuiState> { static util::StatusOr<DotrainGuiState> From(const MetaDocumentItem& item); };

}  // namespace rainmeta::v1

#endif  // RAINMETA_TYPES_HPP_
