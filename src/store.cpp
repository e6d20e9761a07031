#include "rainmeta/store.hpp"

#include <algorithm>

#include "rainmeta/crypto.hpp"
#include "rainmeta/logging.hpp"

namespace rainmeta::v1 {

namespace {

constexpr const char* kLogCategory = "store";

byte_vec Key(util::Span<const uint8_t> bytes) {
    return byte_vec(bytes.begin(), bytes.end());
}

}  // namespace

// ==== NPE2Deployer ====

bool NPE2Deployer::IsCorrupt() const {
    return meta_hash.empty() || meta_bytes.empty() || bytecode.empty() || parser.empty() || store.empty() ||
           interpreter.empty();
}

bool NPE2Deployer::operator==(const NPE2Deployer& other) const {
    return meta_hash == other.meta_hash && meta_bytes == other.meta_bytes && bytecode == other.bytecode &&
           parser == other.parser && store == other.store && interpreter == other.interpreter &&
           authoring_meta == other.authoring_meta;
}

// ==== Construction ====

Store Store::WithDefaultSubgraphs() {
    Store store;
    store.AddSubgraphs(DefaultSubgraphs());
    return store;
}

Store Store::Create(const std::vector<std::string>& subgraphs, const Cache& cache,
                    const DeployerCache& deployer_cache, const DotrainCache& dotrain_cache,
                    bool include_default_subgraphs) {
    Store store = include_default_subgraphs ? WithDefaultSubgraphs() : Store();
    store.AddSubgraphs(subgraphs);
    for (const auto& [hash, bytes] : cache) {
        if (!store.UpdateWith(hash, bytes)) {
            RAINMETA_LOG_WARN(kLogCategory, "dropping cache entry " + util::HexEncode(hash) + ": bytes do not match hash");
        }
    }
    // Deployer meta goes through the same hash check and never replaces a verified entry.
    for (const auto& [hash, deployer] : deployer_cache) {
        if (!store.UpdateWith(deployer.meta_hash, deployer.meta_bytes)) {
            RAINMETA_LOG_WARN(kLogCategory, "not caching meta of deployer " + util::HexEncode(hash) +
                                                ": bytes do not match meta hash");
        }
        store.deployer_cache_[hash] = deployer;
    }
    for (const auto& [uri, hash] : dotrain_cache) {
        if (store.dotrain_cache_.count(uri) == 0 && store.cache_.count(hash) != 0) {
            store.dotrain_cache_.emplace(uri, hash);
        }
    }
    return store;
}

Store Store::FromConfig(const Config& config) {
    ThreadPool::GetInstance(config.store.resolver_threads);
    Store store = config.store.include_default_subgraphs ? WithDefaultSubgraphs() : Store();
    store.AddSubgraphs(config.store.subgraphs);
    return store;
}

void Store::AddSubgraphs(const std::vector<std::string>& subgraphs) {
    for (const auto& subgraph : subgraphs) {
        if (std::find(subgraphs_.begin(), subgraphs_.end(), subgraph) == subgraphs_.end()) {
            subgraphs_.push_back(subgraph);
        }
    }
}

std::optional<const byte_vec*> Store::GetMeta(util::Span<const uint8_t> hash) const {
    auto it = cache_.find(Key(hash));
    if (it != cache_.end()) return &it->second;
    return std::nullopt;
}

// ==== Deployers ====

std::optional<const NPE2Deployer*> Store::GetDeployer(util::Span<const uint8_t> hash) const {
    const byte_vec key = Key(hash);
    auto it = deployer_cache_.find(key);
    if (it != deployer_cache_.end()) return &it->second;

    auto alias = deployer_hash_map_.find(key);
    if (alias == deployer_hash_map_.end()) return std::nullopt;
    it = deployer_cache_.find(alias->second);
    if (it != deployer_cache_.end()) return &it->second;
    return std::nullopt;
}

std::optional<const NPE2Deployer*> Store::SearchDeployer(util::Span<const uint8_t> hash) {
    auto response_or = v1::SearchDeployer(resolver_, hash, subgraphs_);
    if (!response_or.ok()) {
        RAINMETA_LOG_DEBUG(kLogCategory, "deployer " + util::HexEncode(hash) + " not resolved: " + response_or.status().message());
        return std::nullopt;
    }
    SetDeployerFromQueryResponse(response_or.value());
    return GetDeployer(hash);
}

std::optional<const NPE2Deployer*> Store::SearchDeployerCheck(util::Span<const uint8_t> hash) {
    if (auto deployer = GetDeployer(hash)) return deployer;
    return SearchDeployer(hash);
}

void Store::SetDeployerFromQueryResponse(const DeployerResponse& response) {
    NPE2Deployer deployer;
    deployer.meta_hash = response.meta_hash;
    deployer.meta_bytes = response.meta_bytes;
    deployer.bytecode = response.bytecode;
    deployer.parser = response.parser;
    deployer.store = response.store;
    deployer.interpreter = response.interpreter;
    deployer.authoring_meta = response.AuthoringMetaFromMeta();
    if (deployer.IsCorrupt()) {
        RAINMETA_LOG_WARN(kLogCategory, "deployer " + util::HexEncode(response.bytecode_meta_hash) + " is incomplete");
    }
    std::optional<byte_vec> tx_hash;
    if (!response.tx_hash.empty()) tx_hash = response.tx_hash;
    SetDeployer(response.bytecode_meta_hash, deployer, tx_hash);
}

void Store::SetDeployer(util::Span<const uint8_t> hash, const NPE2Deployer& deployer, std::optional<byte_vec> tx_hash) {
    cache_[deployer.meta_hash] = deployer.meta_bytes;
    deployer_cache_[Key(hash)] = deployer;
    if (tx_hash) deployer_hash_map_[*tx_hash] = Key(hash);
}

// ==== Dotrain Index ====

std::optional<const byte_vec*> Store::GetDotrainHash(const std::string& uri) const {
    auto it = dotrain_cache_.find(uri);
    if (it != dotrain_cache_.end()) return &it->second;
    return std::nullopt;
}

std::optional<const std::string*> Store::GetDotrainUri(util::Span<const uint8_t> hash) const {
    const byte_vec key = Key(hash);
    for (const auto& [uri, h] : dotrain_cache_) {
        if (h == key) return &uri;
    }
    return std::nullopt;
}

std::optional<const byte_vec*> Store::GetDotrainMeta(const std::string& uri) const {
    auto hash = GetDotrainHash(uri);
    if (!hash) return std::nullopt;
    return GetMeta(*hash.value());
}

std::pair<byte_vec, byte_vec> Store::SetDotrain(const std::string& text, const std::string& uri, bool keep_old) {
    byte_vec bytes = DotrainMeta{text}.ToDocumentItem().CborEncode();
    byte_vec new_hash = ToBytes(Keccak256(bytes));

    auto it = dotrain_cache_.find(uri);
    if (it == dotrain_cache_.end()) {
        dotrain_cache_.emplace(uri, new_hash);
        cache_[new_hash] = std::move(bytes);
        RAINMETA_LOG_DEBUG(kLogCategory, "dotrain " + uri + " -> " + util::HexEncode(new_hash));
        return {new_hash, byte_vec()};
    }

    byte_vec old_hash = it->second;
    cache_[new_hash] = std::move(bytes);
    if (old_hash == new_hash) return {new_hash, byte_vec()};

    it->second = new_hash;
    if (!keep_old) cache_.erase(old_hash);
    RAINMETA_LOG_DEBUG(kLogCategory, "dotrain " + uri + " changed " + util::HexEncode(old_hash) + " -> " + util::HexEncode(new_hash));
    return {new_hash, old_hash};
}

void Store::DeleteDotrain(const std::string& uri, bool keep_meta) {
    auto it = dotrain_cache_.find(uri);
    if (it == dotrain_cache_.end()) return;
    if (!keep_meta) cache_.erase(it->second);
    dotrain_cache_.erase(it);
}

// ==== Merge ====

void Store::Merge(const Store& other) {
    AddSubgraphs(other.subgraphs_);
    for (const auto& [hash, bytes] : other.cache_) cache_.emplace(hash, bytes);
    for (const auto& [hash, deployer] : other.deployer_cache_) deployer_cache_.emplace(hash, deployer);
    for (const auto& [tx_hash, hash] : other.deployer_hash_map_) deployer_hash_map_[tx_hash] = hash;
    for (const auto& [uri, hash] : other.dotrain_cache_) dotrain_cache_.emplace(uri, hash);
    RAINMETA_LOG_DEBUG(kLogCategory, "merged store, " + std::to_string(cache_.size()) + " cached metas");
}

// ==== Cache Updates ====

std::optional<const byte_vec*> Store::Update(util::Span<const uint8_t> hash) {
    auto response_or = Search(resolver_, hash, subgraphs_);
    if (!response_or.ok()) {
        RAINMETA_LOG_DEBUG(kLogCategory, "meta " + util::HexEncode(hash) + " not resolved: " + response_or.status().message());
        return std::nullopt;
    }
    const byte_vec& bytes = response_or.value().bytes;
    if (ToBytes(Keccak256(bytes)) != Key(hash)) {
        RAINMETA_LOG_WARN(kLogCategory, "resolver returned bytes that do not hash to " + util::HexEncode(hash));
        return std::nullopt;
    }
    StoreContent(bytes);
    auto& entry = cache_[Key(hash)];
    entry = bytes;
    return &entry;
}

std::optional<const byte_vec*> Store::UpdateCheck(util::Span<const uint8_t> hash) {
    if (auto cached = GetMeta(hash)) return cached;
    return Update(hash);
}

std::optional<const byte_vec*> Store::UpdateWith(util::Span<const uint8_t> hash, util::Span<const uint8_t> bytes) {
    auto admitted = UpdateWithStatus(hash, bytes);
    if (!admitted.ok()) return std::nullopt;
    return admitted.value();
}

util::StatusOr<const byte_vec*> Store::UpdateWithStatus(util::Span<const uint8_t> hash,
                                                        util::Span<const uint8_t> bytes) {
    if (ToBytes(Keccak256(bytes)) != Key(hash)) {
        return util::Status::HashMismatch("bytes do not hash to " + util::HexEncode(hash));
    }
    if (auto cached = GetMeta(hash)) return cached.value();

    StoreContent(bytes);
    auto& entry = cache_[Key(hash)];
    entry = Key(bytes);
    return static_cast<const byte_vec*>(&entry);
}

void Store::StoreContent(util::Span<const uint8_t> bytes) {
    if (!HasMagicPrefix(bytes, KnownMagic::kRainMetaDocumentV1)) return;
    auto items_or = MetaDocumentItem::CborDecode(bytes);
    if (!items_or.ok()) {
        RAINMETA_LOG_DEBUG(kLogCategory, "not indexing items: " + items_or.status().message());
        return;
    }
    for (const auto& item : items_or.value()) {
        byte_vec encoded = item.CborEncode();
        cache_[ToBytes(Keccak256(encoded))] = std::move(encoded);
    }
}

bool Store::operator==(const Store& other) const {
    return subgraphs_ == other.subgraphs_ && cache_ == other.cache_ && dotrain_cache_ == other.dotrain_cache_ &&
           deployer_cache_ == other.deployer_cache_ && deployer_hash_map_ == other.deployer_hash_map_;
}

}  // namespace rainmeta::v1
