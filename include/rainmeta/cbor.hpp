// ====================================================================================
// RAINMETA - CBOR (RFC 8949) Value, Writer & Reader
//
// The writer always emits definite lengths with the shortest head form, which is
// what keeps meta map encodings (and therefore their hashes) reproducible. The
// reader accepts any well-formed item, one complete item per ReadValue() call.
// ====================================================================================

#ifndef RAINMETA_CBOR_HPP_
#define RAINMETA_CBOR_HPP_

#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "rainmeta/status.hpp"

namespace rainmeta::v1::cbor {

enum class MajorType : uint8_t {
    kUnsigned = 0,
    kNegative = 1,
    kBytes = 2,
    kText = 3,
    kArray = 4,
    kMap = 5,
    kTag = 6,
    kSimple = 7
};

constexpr size_t kMaxNestingDepth = 64;

class Value {
public:
    enum class Kind : uint8_t { kUnsigned, kNegative, kBytes, kText, kArray, kMap, kTag, kBool, kNull, kUndefined, kSimple, kFloat };
    using Array = std::vector<Value>;
    using Map = std::vector<std::pair<Value, Value>>;

    Value() : kind_(Kind::kNull) {}

    static Value Unsigned(uint64_t value);
    // Encodes -1 - n.
    static Value Negative(uint64_t n);
    static Value Bytes(std::vector<uint8_t> bytes);
    static Value Text(std::string text);
    static Value MakeArray(Array items);
    static Value MakeMap(Map entries);
    static Value Tagged(uint64_t tag, Value inner);
    static Value Bool(bool value);
    static Value Null();
    static Value Undefined();
    static Value Simple(uint8_t value);
    static Value Float(double value);

    Kind kind() const { return kind_; }
    bool is_unsigned() const { return kind_ == Kind::kUnsigned; }
    bool is_bytes() const { return kind_ == Kind::kBytes; }
    bool is_text() const { return kind_ == Kind::kText; }
    bool is_array() const { return kind_ == Kind::kArray; }
    bool is_map() const { return kind_ == Kind::kMap; }
    bool is_null() const { return kind_ == Kind::kNull; }

    // Integer argument: unsigned value, negative n, tag number, simple value or bool.
    uint64_t integer() const { return integer_; }
    const std::vector<uint8_t>& bytes() const { return bytes_; }
    std::string text() const { return std::string(bytes_.begin(), bytes_.end()); }
    const Array& array() const { return items_; }
    const Map& map() const { return entries_; }
    const Value& tagged() const { return items_.front(); }
    double float_value() const { return float_; }

    // Map lookups by unsigned-int or text key. Null when absent or not a map.
    const Value* Find(uint64_t key) const;
    const Value* Find(std::string_view key) const;

    bool operator==(const Value& other) const;
    bool operator!=(const Value& other) const { return !(*this == other); }

private:
    explicit Value(Kind kind) : kind_(kind) {}

    Kind kind_;
    uint64_t integer_ = 0;
    double float_ = 0.0;
    std::vector<uint8_t> bytes_;
    Array items_;
    Map entries_;
};

class Writer {
public:
    explicit Writer(std::vector<uint8_t>* out) : out_(out) {}

    void WriteHead(MajorType major, uint64_t argument);
    void WriteUnsigned(uint64_t value) { WriteHead(MajorType::kUnsigned, value); }
    void WriteBytes(util::Span<const uint8_t> bytes);
    void WriteText(std::string_view text);
    void WriteArrayHeader(size_t count) { WriteHead(MajorType::kArray, count); }
    void WriteMapHeader(size_t count) { WriteHead(MajorType::kMap, count); }
    void WriteBool(bool value);
    void WriteNull();
    void Write(const Value& value);

private:
    std::vector<uint8_t>* out_;
};

class Reader {
public:
    explicit Reader(util::Span<const uint8_t> data) : data_(data), offset_(0) {}

    // Decodes one complete data item. On failure the read offset is left unchanged.
    util::StatusOr<Value> ReadValue();
    size_t offset() const { return offset_; }
    bool AtEnd() const { return offset_ >= data_.size(); }

private:
    util::StatusOr<Value> ReadItem(size_t depth);
    util::StatusOr<uint64_t> ReadArgument(uint8_t additional_info);
    util::StatusOr<std::vector<uint8_t>> ReadRaw(uint64_t length);
    util::StatusOr<std::vector<uint8_t>> ReadString(MajorType major, uint8_t additional_info);
    bool PeekBreak() const { return offset_ < data_.size() && data_[offset_] == 0xff; }

    util::Span<const uint8_t> data_;
    size_t offset_;
};

// Encodes a single value with the writer above.
std::vector<uint8_t> Encode(const Value& value);
// Decodes exactly one value that must span all of `data`.
util::StatusOr<Value> DecodeOne(util::Span<const uint8_t> data);

}  // namespace rainmeta::v1::cbor

#endif  // RAINMETA_CBOR_HPP_
