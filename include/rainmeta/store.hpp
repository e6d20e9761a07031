// ====================================================================================
// RAINMETA - Content Addressed Store
//
// In-memory cache of meta bytes keyed by keccak256, a uri -> hash index for
// dotrain documents, and a deployer bundle cache with a tx hash alias index.
// A Store is a plain value with no internal locking; callers serialize access.
// ====================================================================================

#ifndef RAINMETA_STORE_HPP_
#define RAINMETA_STORE_HPP_

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "rainmeta/config.hpp"
#include "rainmeta/resolver.hpp"
#include "rainmeta/types.hpp"

namespace rainmeta::v1 {

// Everything needed to reproduce an NPE2 expression deployer locally.
struct NPE2Deployer {
    byte_vec meta_hash;
    byte_vec meta_bytes;
    byte_vec bytecode;
    byte_vec parser;
    byte_vec store;
    byte_vec interpreter;
    std::optional<AuthoringMeta> authoring_meta;

    // True when any required field is empty.
    bool IsCorrupt() const;
    bool operator==(const NPE2Deployer& other) const;
};

class Store {
public:
    using Cache = std::map<byte_vec, byte_vec>;
    using DotrainCache = std::map<std::string, byte_vec>;
    using DeployerCache = std::map<byte_vec, NPE2Deployer>;
    using DeployerHashMap = std::map<byte_vec, byte_vec>;

    Store() = default;
    static Store WithDefaultSubgraphs();
    // Cache entries whose bytes do not hash to their key are dropped, and dotrain
    // entries are kept only when their hash made it into the cache.
    static Store Create(const std::vector<std::string>& subgraphs, const Cache& cache,
                        const DeployerCache& deployer_cache, const DotrainCache& dotrain_cache,
                        bool include_default_subgraphs);
    static Store FromConfig(const Config& config);

    void SetResolver(std::shared_ptr<MetadataResolver> resolver) { resolver_ = std::move(resolver); }
    const std::shared_ptr<MetadataResolver>& resolver() const { return resolver_; }

    const std::vector<std::string>& subgraphs() const { return subgraphs_; }
    const Cache& cache() const { return cache_; }
    const DotrainCache& dotrain_cache() const { return dotrain_cache_; }
    const DeployerCache& deployer_cache() const { return deployer_cache_; }
    const DeployerHashMap& deployer_hash_map() const { return deployer_hash_map_; }

    void AddSubgraphs(const std::vector<std::string>& subgraphs);

    std::optional<const byte_vec*> GetMeta(util::Span<const uint8_t> hash) const;

    // Direct lookup first, then through the tx hash alias.
    std::optional<const NPE2Deployer*> GetDeployer(util::Span<const uint8_t> hash) const;
    std::optional<const NPE2Deployer*> SearchDeployer(util::Span<const uint8_t> hash);
    std::optional<const NPE2Deployer*> SearchDeployerCheck(util::Span<const uint8_t> hash);
    void SetDeployerFromQueryResponse(const DeployerResponse& response);
    void SetDeployer(util::Span<const uint8_t> hash, const NPE2Deployer& deployer,
                     std::optional<byte_vec> tx_hash = std::nullopt);

    std::optional<const byte_vec*> GetDotrainHash(const std::string& uri) const;
    std::optional<const std::string*> GetDotrainUri(util::Span<const uint8_t> hash) const;
    std::optional<const byte_vec*> GetDotrainMeta(const std::string& uri) const;
    // Returns (new hash, previous hash or empty).
    std::pair<byte_vec, byte_vec> SetDotrain(const std::string& text, const std::string& uri, bool keep_old);
    void DeleteDotrain(const std::string& uri, bool keep_meta);

    // Subgraphs are unioned, cache/deployer/dotrain entries already present here are
    // kept, and alias entries from `other` overwrite ours.
    void Merge(const Store& other);

    std::optional<const byte_vec*> Update(util::Span<const uint8_t> hash);
    std::optional<const byte_vec*> UpdateCheck(util::Span<const uint8_t> hash);
    std::optional<const byte_vec*> UpdateWith(util::Span<const uint8_t> hash, util::Span<const uint8_t> bytes);
    // Same as UpdateWith but reports kHashMismatch instead of an empty result.
    util::StatusOr<const byte_vec*> UpdateWithStatus(util::Span<const uint8_t> hash, util::Span<const uint8_t> bytes);

    bool operator==(const Store& other) const;
    bool operator!=(const Store& other) const { return !(*this == other); }

private:
    // Indexes every item of a RainMetaDocumentV1 sequence under its item hash.
    void StoreContent(util::Span<const uint8_t> bytes);

    std::vector<std::string> subgraphs_;
    Cache cache_;
    DotrainCache dotrain_cache_;
    DeployerCache deployer_cache_;
    DeployerHashMap deployer_hash_map_;
    std::shared_ptr<MetadataResolver> resolver_;
};

}  // namespace rainmeta::v1

#endif  // RAINMETA_STORE_HPP_
