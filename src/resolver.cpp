#include "rainmeta/resolver.hpp"

#include "rainmeta/crypto.hpp"

namespace rainmeta::v1 {

std::optional<AuthoringMeta> DeployerResponse::AuthoringMetaFromMeta() const {
    auto items_or = MetaDocumentItem::CborDecode(meta_bytes);
    if (!items_or.ok()) return std::nullopt;
    for (const auto& item : items_or.value()) {
        if (item.magic != KnownMagic::kAuthoringMetaV1) continue;
        auto meta_or = item.UnpackInto<AuthoringMeta>();
        if (meta_or.ok()) return meta_or.value();
        RAINMETA_LOG_WARN("resolver", "deployer authoring meta does not decode: " + meta_or.status().message());
        return std::nullopt;
    }
    return std::nullopt;
}

util::StatusOr<MetaResponse> Search(const std::shared_ptr<MetadataResolver>& resolver, util::Span<const uint8_t> hash,
                                    const std::vector<std::string>& endpoints) {
    if (!resolver) return util::Status::ResolverError("no metadata resolver configured");
    const std::string hash_hex = util::HexEncode(hash);
    std::shared_ptr<MetadataResolver> shared = resolver;
    return RaceFirstSuccess<MetaResponse>(endpoints, [shared, hash_hex](const std::string& endpoint) {
        return shared->Query(hash_hex, endpoint);
    });
}

util::StatusOr<DeployerResponse> SearchDeployer(const std::shared_ptr<MetadataResolver>& resolver,
                                                util::Span<const uint8_t> hash,
                                                const std::vector<std::string>& endpoints) {
    if (!resolver) return util::Status::ResolverError("no metadata resolver configured");
    const std::string hash_hex = util::HexEncode(hash);
    std::shared_ptr<MetadataResolver> shared = resolver;
    return RaceFirstSuccess<DeployerResponse>(endpoints, [shared, hash_hex](const std::string& endpoint) {
        return shared->QueryDeployer(hash_hex, endpoint);
    });
}

}  // namespace rainmeta::v1
