// ====================================================================================
// RAINMETA - Deployment Data
//
// Builds the emitMeta(bytes32 subject, bytes meta) record that publishes a dotrain
// source on a metaboard contract.
// ====================================================================================

#ifndef RAINMETA_DEPLOYMENT_HPP_
#define RAINMETA_DEPLOYMENT_HPP_

#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

#include "rainmeta/types.hpp"

namespace rainmeta::v1 {

constexpr const char* kEmitMetaSignature = "emitMeta(bytes32,bytes)";

// All fields are 0x-prefixed lowercase hex.
struct DeploymentData {
    std::string subject;
    std::string meta_bytes;
    std::string calldata;

    nlohmann::json ToJson() const;
};

class CalldataEncoder {
public:
    virtual ~CalldataEncoder() = default;
    virtual util::StatusOr<byte_vec> EncodeEmitMeta(const Hash32& subject, util::Span<const uint8_t> meta) const = 0;
};

// selector(emitMeta(bytes32,bytes)) ++ subject ++ offset ++ length ++ padded meta
class EmitMetaEncoder final : public CalldataEncoder {
public:
    util::StatusOr<byte_vec> EncodeEmitMeta(const Hash32& subject, util::Span<const uint8_t> meta) const override;
};

// Rejects empty and whitespace-only content with kInvalidInput.
util::Status ValidateDotrainContent(std::string_view content);

// Subject is the document hash of the DotrainSourceV1 item; meta is its one-item sequence.
util::StatusOr<DeploymentData> GenerateDotrainDeployment(std::string_view content,
                                                         const CalldataEncoder& encoder = EmitMetaEncoder());

// Calldata for a bare item: subject is its item hash and meta its single-item encoding.
util::StatusOr<byte_vec> GenerateEmitMetaCalldata(const MetaDocumentItem& item,
                                                  const CalldataEncoder& encoder = EmitMetaEncoder());

}  // namespace rainmeta::v1

#endif  // RAINMETA_DEPLOYMENT_HPP_
