#include "rainmeta/types.hpp"

#include <algorithm>

#include "rainmeta/cbor.hpp"

namespace rainmeta::v1 {

namespace {

using cbor::Value;

Value TextValue(const std::string& text) { return Value::Text(text); }

Value ValueCfgToCbor(const ValueCfg& cfg) {
    return Value::MakeMap({
        {TextValue("id"), TextValue(cfg.id)},
        {TextValue("name"), cfg.name ? TextValue(*cfg.name) : Value::Null()},
        {TextValue("value"), TextValue(cfg.value)},
    });
}

Value TokenCfgToCbor(const TokenCfg& cfg) {
    return Value::MakeMap({
        {TextValue("network"), TextValue(cfg.network)},
        {TextValue("address"), TextValue(util::HexEncode(util::Span<const uint8_t>(cfg.address.data(), cfg.address.size())))},
    });
}

util::StatusOr<const Value*> RequireField(const Value& map, const char* key) {
    const Value* field = map.Find(std::string_view(key));
    if (field == nullptr) return util::Status::CborError(std::string("missing field ") + key);
    return field;
}

util::StatusOr<std::string> RequireText(const Value& map, const char* key) {
    RAINMETA_ASSIGN_OR_RETURN(const Value* field, RequireField(map, key));
    if (!field->is_text()) return util::Status::CborError(std::string(key) + " must be text");
    return Utf8FromBytes(field->bytes());
}

util::StatusOr<std::optional<std::string>> OptionalText(const Value& value, const char* key) {
    if (value.is_null()) return std::optional<std::string>();
    if (!value.is_text()) return util::Status::CborError(std::string(key) + " must be text or null");
    RAINMETA_ASSIGN_OR_RETURN(std::string text, Utf8FromBytes(value.bytes()));
    return std::optional<std::string>(std::move(text));
}

template <size_t N>
util::StatusOr<std::array<uint8_t, N>> HexFixed(const std::string& text, const char* key) {
    auto bytes_or = util::HexDecode(text);
    if (!bytes_or.ok() || bytes_or.value().size() != N) {
        return util::Status::CborError(std::string(key) + " must be " + std::to_string(N) + " hex encoded bytes");
    }
    std::array<uint8_t, N> out;
    std::copy(bytes_or.value().begin(), bytes_or.value().end(), out.begin());
    return out;
}

util::StatusOr<ValueCfg> ValueCfgFromCbor(const Value& value) {
    if (!value.is_map()) return util::Status::CborError("value config must be a map");
    ValueCfg cfg;
    RAINMETA_ASSIGN_OR_RETURN(cfg.id, RequireText(value, "id"));
    RAINMETA_ASSIGN_OR_RETURN(const Value* name, RequireField(value, "name"));
    RAINMETA_ASSIGN_OR_RETURN(cfg.name, OptionalText(*name, "name"));
    RAINMETA_ASSIGN_OR_RETURN(cfg.value, RequireText(value, "value"));
    return cfg;
}

util::StatusOr<TokenCfg> TokenCfgFromCbor(const Value& value) {
    if (!value.is_map()) return util::Status::CborError("token config must be a map");
    TokenCfg cfg;
    RAINMETA_ASSIGN_OR_RETURN(cfg.network, RequireText(value, "network"));
    RAINMETA_ASSIGN_OR_RETURN(std::string address, RequireText(value, "address"));
    RAINMETA_ASSIGN_OR_RETURN(cfg.address, HexFixed<20>(address, "address"));
    return cfg;
}

// Text-keyed map whose values are decoded by `decode`.
template <typename T, typename Decode>
util::StatusOr<std::map<std::string, T>> DecodeNamedMap(const Value& root, const char* key, Decode decode) {
    RAINMETA_ASSIGN_OR_RETURN(const Value* field, RequireField(root, key));
    if (!field->is_map()) return util::Status::CborError(std::string(key) + " must be a map");
    std::map<std::string, T> out;
    for (const auto& [name, entry] : field->map()) {
        if (!name.is_text()) return util::Status::CborError(std::string(key) + " keys must be text");
        RAINMETA_ASSIGN_OR_RETURN(T decoded, decode(entry));
        out.emplace(name.text(), std::move(decoded));
    }
    return out;
}

}  // namespace

std::vector<Address> DotrainGuiState::TokenAddresses() const {
    std::vector<Address> addresses;
    for (const auto& [name, token] : select_tokens) addresses.push_back(token.address);
    return addresses;
}

std::vector<std::string> DotrainGuiState::VaultIds() const {
    std::vector<std::string> ids;
    for (const auto& [name, id] : vault_ids) {
        if (id) ids.push_back(*id);
    }
    return ids;
}

byte_vec DotrainGuiState::CborEncodePayload() const {
    Value::Map field_map, deposit_map, token_map, vault_map;
    for (const auto& [name, cfg] : field_values) field_map.emplace_back(TextValue(name), ValueCfgToCbor(cfg));
    for (const auto& [name, cfg] : deposits) deposit_map.emplace_back(TextValue(name), ValueCfgToCbor(cfg));
    for (const auto& [name, cfg] : select_tokens) token_map.emplace_back(TextValue(name), TokenCfgToCbor(cfg));
    for (const auto& [name, id] : vault_ids) vault_map.emplace_back(TextValue(name), id ? TextValue(*id) : Value::Null());

    const Value root = Value::MakeMap({
        {TextValue("dotrain_hash"), TextValue(util::HexEncode(util::Span<const uint8_t>(dotrain_hash.data(), dotrain_hash.size())))},
        {TextValue("field_values"), Value::MakeMap(std::move(field_map))},
        {TextValue("deposits"), Value::MakeMap(std::move(deposit_map))},
        {TextValue("select_tokens"), Value::MakeMap(std::move(token_map))},
        {TextValue("vault_ids"), Value::MakeMap(std::move(vault_map))},
        {TextValue("selected_deployment"), TextValue(selected_deployment)},
    });
    return cbor::Encode(root);
}

util::StatusOr<DotrainGuiState> DotrainGuiState::CborDecodePayload(util::Span<const uint8_t> data) {
    RAINMETA_ASSIGN_OR_RETURN(Value root, cbor::DecodeOne(data));
    if (!root.is_map()) return util::Status::CborError("gui state must be a map");

    DotrainGuiState state;
    RAINMETA_ASSIGN_OR_RETURN(std::string hash, RequireText(root, "dotrain_hash"));
    RAINMETA_ASSIGN_OR_RETURN(state.dotrain_hash, HexFixed<kHashSize>(hash, "dotrain_hash"));
    RAINMETA_ASSIGN_OR_RETURN(state.field_values, DecodeNamedMap<ValueCfg>(root, "field_values", ValueCfgFromCbor));
    RAINMETA_ASSIGN_OR_RETURN(state.deposits, DecodeNamedMap<ValueCfg>(root, "deposits", ValueCfgFromCbor));
    RAINMETA_ASSIGN_OR_RETURN(state.select_tokens, DecodeNamedMap<TokenCfg>(root, "select_tokens", TokenCfgFromCbor));
    RAINMETA_ASSIGN_OR_RETURN(
        state.vault_ids,
        DecodeNamedMap<std::optional<std::string>>(root, "vault_ids",
                                                   [](const Value& value) { return OptionalText(value, "vault id"); }));
    RAINMETA_ASSIGN_OR_RETURN(state.selected_deployment, RequireText(root, "selected_deployment"));
    return state;
}

MetaDocumentItem DotrainGuiState::ToDocumentItem() const {
    return MetaDocumentItem{CborEncodePayload(), KnownMagic::kDotrainGuiStateV1, ContentType::kOctetStream};
}

util::StatusOr<DotrainGuiState> DotrainGuiState::FromDocumentItem(const MetaDocumentItem& item) {
    RAINMETA_RETURN_IF_ERROR(ExpectMagic(item, KnownMagic::kDotrainGuiStateV1));
    RAINMETA_ASSIGN_OR_RETURN(byte_vec payload, item.Unpack());
    return CborDecodePayload(payload);
}

util::StatusOr<std::optional<DotrainGuiState>> DotrainGuiState::ExtractFromMeta(util::Span<const uint8_t> data) {
    RAINMETA_ASSIGN_OR_RETURN(std::vector<MetaDocumentItem> items, MetaDocumentItem::CborDecode(data));
    for (const auto& item : items) {
        if (item.magic == KnownMagic::kRainMetaDocumentV1) {
            RAINMETA_ASSIGN_OR_RETURN(std::optional<DotrainGuiState> nested, ExtractFromMeta(item.payload));
            if (nested) return nested;
        }
        if (item.magic == KnownMagic::kDotrainGuiStateV1) {
            RAINMETA_ASSIGN_OR_RETURN(DotrainGuiState state, FromDocumentItem(item));
            return std::optional<DotrainGuiState>(std::move(state));
        }
    }
    return std::optional<DotrainGuiState>();
}

bool DotrainGuiState::operator==(const DotrainGuiState& other) const {
    return dotrain_hash == other.dotrain_hash && field_values == other.field_values && deposits == other.deposits &&
           select_tokens == other.select_tokens && vault_ids == other.vault_ids &&
           selected_deployment == other.selected_deployment;
}

}  // namespace rainmeta::v1
