#include "rainmeta/content.hpp"

#include <array>
#include <limits>
#include <string>

#include <zlib.h>

namespace rainmeta::v1 {

namespace {

constexpr int kZlibWindowBits = 15;
constexpr int kRawDeflateWindowBits = -15;
constexpr size_t kInflateChunkSize = 16 * 1024;

util::StatusOr<std::vector<uint8_t>> Inflate(util::Span<const uint8_t> data, int window_bits) {
    if (data.size() > std::numeric_limits<uInt>::max()) return util::Status::InflateError("input too large");

    z_stream stream{};
    if (inflateInit2(&stream, window_bits) != Z_OK) return util::Status::InflateError("inflateInit2 failed");
    stream.next_in = const_cast<Bytef*>(data.data());
    stream.avail_in = static_cast<uInt>(data.size());

    std::vector<uint8_t> out;
    std::array<uint8_t, kInflateChunkSize> chunk;
    int ret = Z_OK;
    do {
        stream.next_out = chunk.data();
        stream.avail_out = static_cast<uInt>(chunk.size());
        ret = inflate(&stream, Z_NO_FLUSH);
        if (ret != Z_OK && ret != Z_STREAM_END) {
            std::string message = stream.msg ? stream.msg : "incomplete or invalid deflate stream";
            inflateEnd(&stream);
            return util::Status::InflateError(message);
        }
        out.insert(out.end(), chunk.data(), chunk.data() + (chunk.size() - stream.avail_out));
    } while (ret != Z_STREAM_END);

    inflateEnd(&stream);
    return out;
}

}  // namespace

const char* ContentTypeToString(ContentType type) {
    switch (type) {
        case ContentType::kJson: return "application/json";
        case ContentType::kCbor: return "application/cbor";
        case ContentType::kOctetStream: return "application/octet-stream";
        case ContentType::kNone: break;
    }
    return "";
}

const char* ContentEncodingToString(ContentEncoding encoding) {
    switch (encoding) {
        case ContentEncoding::kIdentity: return "identity";
        case ContentEncoding::kDeflate: return "deflate";
        case ContentEncoding::kNone: break;
    }
    return "";
}

const char* ContentLanguageToString(ContentLanguage language) {
    switch (language) {
        case ContentLanguage::kEn: return "en";
        case ContentLanguage::kNone: break;
    }
    return "";
}

util::StatusOr<ContentType> ContentTypeFromString(std::string_view text) {
    for (ContentType type : {ContentType::kJson, ContentType::kCbor, ContentType::kOctetStream}) {
        if (text == ContentTypeToString(type)) return type;
    }
    return util::Status::CborError("unknown content type: " + std::string(text));
}

util::StatusOr<ContentEncoding> ContentEncodingFromString(std::string_view text) {
    for (ContentEncoding encoding : {ContentEncoding::kIdentity, ContentEncoding::kDeflate}) {
        if (text == ContentEncodingToString(encoding)) return encoding;
    }
    return util::Status::CborError("unknown content encoding: " + std::string(text));
}

util::StatusOr<ContentLanguage> ContentLanguageFromString(std::string_view text) {
    if (text == ContentLanguageToString(ContentLanguage::kEn)) return ContentLanguage::kEn;
    return util::Status::CborError("unknown content language: " + std::string(text));
}

util::StatusOr<std::vector<uint8_t>> EncodeContent(ContentEncoding encoding, util::Span<const uint8_t> data) {
    if (encoding != ContentEncoding::kDeflate) return std::vector<uint8_t>(data.begin(), data.end());

    if (data.size() > std::numeric_limits<uLong>::max()) return util::Status::Error("input too large to deflate");
    uLongf compressed_size = compressBound(static_cast<uLong>(data.size()));
    std::vector<uint8_t> out(compressed_size);
    const int ret = compress2(out.data(), &compressed_size, data.data(), static_cast<uLong>(data.size()),
                              Z_DEFAULT_COMPRESSION);
    if (ret != Z_OK) return util::Status::Error("deflate failed with zlib code " + std::to_string(ret));
    out.resize(compressed_size);
    return out;
}

util::StatusOr<std::vector<uint8_t>> DecodeContent(ContentEncoding encoding, util::Span<const uint8_t> data) {
    if (encoding != ContentEncoding::kDeflate) return std::vector<uint8_t>(data.begin(), data.end());

    auto zlib_or = Inflate(data, kZlibWindowBits);
    if (zlib_or.ok()) return zlib_or;
    auto raw_or = Inflate(data, kRawDeflateWindowBits);
    if (raw_or.ok()) return raw_or;
    return util::Status::InflateError("neither zlib nor raw deflate stream: " + raw_or.status().message());
}

}  // namespace rainmeta::v1
