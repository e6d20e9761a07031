#include "rainmeta/status.hpp"

namespace rainmeta::util {

const char* StatusCodeName(StatusCode code) {
    switch (code) {
        case StatusCode::kOk: return "OK";
        case StatusCode::kError: return "ERROR";
        case StatusCode::kNotFound: return "NOT_FOUND";
        case StatusCode::kUnknownMagic: return "UNKNOWN_MAGIC";
        case StatusCode::kUnsupportedMeta: return "UNSUPPORTED_META";
        case StatusCode::kInvalidMetaMagic: return "INVALID_META_MAGIC";
        case StatusCode::kCorruptMeta: return "CORRUPT_META";
        case StatusCode::kInflateError: return "INFLATE_ERROR";
        case StatusCode::kCborError: return "CBOR_ERROR";
        case StatusCode::kUtf8Error: return "UTF8_ERROR";
        case StatusCode::kJsonError: return "JSON_ERROR";
        case StatusCode::kAbiError: return "ABI_ERROR";
        case StatusCode::kBiggerThan32Bytes: return "BIGGER_THAN_32_BYTES";
        case StatusCode::kDecodeHexStringError: return "DECODE_HEX_STRING_ERROR";
        case StatusCode::kInvalidInput: return "INVALID_INPUT";
        case StatusCode::kHashMismatch: return "HASH_MISMATCH";
        case StatusCode::kResolverError: return "RESOLVER_ERROR";
    }
    return "UNKNOWN";
}

std::string Status::ToString() const {
    if (ok()) return "OK";
    std::string out = StatusCodeName(code_);
    if (!message_.empty()) out += ": " + message_;
    return out;
}

}  // namespace rainmeta::util
