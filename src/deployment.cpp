#include "rainmeta/deployment.hpp"

#include <algorithm>
#include <cctype>

#include "rainmeta/abi.hpp"
#include "rainmeta/logging.hpp"

namespace rainmeta::v1 {

nlohmann::json DeploymentData::ToJson() const {
    return {{"subject", subject}, {"meta_bytes", meta_bytes}, {"calldata", calldata}};
}

util::StatusOr<byte_vec> EmitMetaEncoder::EncodeEmitMeta(const Hash32& subject, util::Span<const uint8_t> meta) const {
    const auto selector = abi::Selector(kEmitMetaSignature);
    byte_vec calldata(selector.begin(), selector.end());
    abi::AppendWord(&calldata, subject);
    abi::AppendUint(&calldata, 2 * abi::kWordSize);
    abi::AppendDynamicBytes(&calldata, meta);
    return calldata;
}

util::Status ValidateDotrainContent(std::string_view content) {
    const bool blank = std::all_of(content.begin(), content.end(),
                                   [](char c) { return std::isspace(static_cast<unsigned char>(c)) != 0; });
    if (blank) return util::Status::InvalidInput("dotrain content is empty");
    return util::Status::Ok();
}

util::StatusOr<DeploymentData> GenerateDotrainDeployment(std::string_view content, const CalldataEncoder& encoder) {
    RAINMETA_RETURN_IF_ERROR(ValidateDotrainContent(content));

    const MetaDocumentItem item = DotrainSource{std::string(content)}.ToDocumentItem();
    const Hash32 subject = item.DocumentHash();
    const byte_vec meta = MetaDocumentItem::CborEncodeSeq({item}, KnownMagic::kRainMetaDocumentV1);
    RAINMETA_ASSIGN_OR_RETURN(byte_vec calldata, encoder.EncodeEmitMeta(subject, meta));

    DeploymentData data;
    data.subject = util::HexEncode(util::Span<const uint8_t>(subject.data(), subject.size()));
    data.meta_bytes = util::HexEncode(meta);
    data.calldata = util::HexEncode(calldata);
    RAINMETA_LOG_DEBUG("deployment", "generated deployment for subject " + data.subject);
    return data;
}

util::StatusOr<byte_vec> GenerateEmitMetaCalldata(const MetaDocumentItem& item, const CalldataEncoder& encoder) {
    return encoder.EncodeEmitMeta(item.ItemHash(), item.CborEncode());
}

}  // namespace rainmeta::v1
