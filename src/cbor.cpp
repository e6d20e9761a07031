#include "rainmeta/cbor.hpp"

#include <cmath>
#include <cstring>

namespace rainmeta::v1::cbor {

namespace {

constexpr uint8_t kIndefinite = 31;

void AppendBE(std::vector<uint8_t>* out, uint64_t value, size_t width) {
    for (size_t i = 0; i < width; ++i) {
        out->push_back(static_cast<uint8_t>((value >> (8 * (width - 1 - i))) & 0xFF));
    }
}

double HalfToDouble(uint16_t half) {
    const int exponent = (half >> 10) & 0x1f;
    const int mantissa = half & 0x3ff;
    double value;
    if (exponent == 0) value = std::ldexp(mantissa, -24);
    else if (exponent != 31) value = std::ldexp(mantissa + 1024, exponent - 25);
    else value = mantissa == 0 ? INFINITY : NAN;
    return (half & 0x8000) ? -value : value;
}

}  // namespace

// ---- Value ----

Value Value::Unsigned(uint64_t value) { Value v(Kind::kUnsigned); v.integer_ = value; return v; }
Value Value::Negative(uint64_t n) { Value v(Kind::kNegative); v.integer_ = n; return v; }
Value Value::Bytes(std::vector<uint8_t> bytes) { Value v(Kind::kBytes); v.bytes_ = std::move(bytes); return v; }
Value Value::Text(std::string text) {
    Value v(Kind::kText);
    v.bytes_.assign(text.begin(), text.end());
    return v;
}
Value Value::MakeArray(Array items) { Value v(Kind::kArray); v.items_ = std::move(items); return v; }
Value Value::MakeMap(Map entries) { Value v(Kind::kMap); v.entries_ = std::move(entries); return v; }
Value Value::Tagged(uint64_t tag, Value inner) {
    Value v(Kind::kTag);
    v.integer_ = tag;
    v.items_.push_back(std::move(inner));
    return v;
}
Value Value::Bool(bool value) { Value v(Kind::kBool); v.integer_ = value ? 1 : 0; return v; }
Value Value::Null() { return Value(Kind::kNull); }
Value Value::Undefined() { return Value(Kind::kUndefined); }
Value Value::Simple(uint8_t value) { Value v(Kind::kSimple); v.integer_ = value; return v; }
Value Value::Float(double value) { Value v(Kind::kFloat); v.float_ = value; return v; }

const Value* Value::Find(uint64_t key) const {
    for (const auto& [k, v] : entries_) {
        if (k.is_unsigned() && k.integer() == key) return &v;
    }
    return nullptr;
}

const Value* Value::Find(std::string_view key) const {
    for (const auto& [k, v] : entries_) {
        if (k.is_text() && k.bytes_.size() == key.size() &&
            std::memcmp(k.bytes_.data(), key.data(), key.size()) == 0) {
            return &v;
        }
    }
    return nullptr;
}

bool Value::operator==(const Value& other) const {
    if (kind_ != other.kind_) return false;
    if (kind_ == Kind::kFloat) return float_ == other.float_;
    return integer_ == other.integer_ && bytes_ == other.bytes_ && items_ == other.items_ &&
           entries_ == other.entries_;
}

// ---- Writer ----

void Writer::WriteHead(MajorType major, uint64_t argument) {
    const uint8_t major_bits = static_cast<uint8_t>(static_cast<uint8_t>(major) << 5);
    if (argument < 24) {
        out_->push_back(major_bits | static_cast<uint8_t>(argument));
    } else if (argument <= 0xff) {
        out_->push_back(major_bits | 24);
        AppendBE(out_, argument, 1);
    } else if (argument <= 0xffff) {
        out_->push_back(major_bits | 25);
        AppendBE(out_, argument, 2);
    } else if (argument <= 0xffffffffULL) {
        out_->push_back(major_bits | 26);
        AppendBE(out_, argument, 4);
    } else {
        out_->push_back(major_bits | 27);
        AppendBE(out_, argument, 8);
    }
}

void Writer::WriteBytes(util::Span<const uint8_t> bytes) {
    WriteHead(MajorType::kBytes, bytes.size());
    out_->insert(out_->end(), bytes.begin(), bytes.end());
}

void Writer::WriteText(std::string_view text) {
    WriteHead(MajorType::kText, text.size());
    out_->insert(out_->end(), text.begin(), text.end());
}

void Writer::WriteBool(bool value) { out_->push_back(value ? 0xf5 : 0xf4); }

void Writer::WriteNull() { out_->push_back(0xf6); }

void Writer::Write(const Value& value) {
    switch (value.kind()) {
        case Value::Kind::kUnsigned: WriteUnsigned(value.integer()); break;
        case Value::Kind::kNegative: WriteHead(MajorType::kNegative, value.integer()); break;
        case Value::Kind::kBytes: WriteBytes(value.bytes()); break;
        case Value::Kind::kText:
            WriteHead(MajorType::kText, value.bytes().size());
            out_->insert(out_->end(), value.bytes().begin(), value.bytes().end());
            break;
        case Value::Kind::kArray:
            WriteArrayHeader(value.array().size());
            for (const auto& item : value.array()) Write(item);
            break;
        case Value::Kind::kMap:
            WriteMapHeader(value.map().size());
            for (const auto& [key, item] : value.map()) {
                Write(key);
                Write(item);
            }
            break;
        case Value::Kind::kTag:
            WriteHead(MajorType::kTag, value.integer());
            Write(value.tagged());
            break;
        case Value::Kind::kBool: WriteBool(value.integer() != 0); break;
        case Value::Kind::kNull: WriteNull(); break;
        case Value::Kind::kUndefined: out_->push_back(0xf7); break;
        case Value::Kind::kSimple:
            if (value.integer() < 24) {
                WriteHead(MajorType::kSimple, value.integer());
            } else {
                out_->push_back(0xf8);
                out_->push_back(static_cast<uint8_t>(value.integer()));
            }
            break;
        case Value::Kind::kFloat: {
            uint64_t bits;
            const double d = value.float_value();
            std::memcpy(&bits, &d, sizeof(bits));
            out_->push_back(0xfb);
            AppendBE(out_, bits, 8);
            break;
        }
    }
}

// ---- Reader ----

util::StatusOr<Value> Reader::ReadValue() {
    const size_t start = offset_;
    auto value_or = ReadItem(0);
    if (!value_or.ok()) offset_ = start;
    return value_or;
}

util::StatusOr<uint64_t> Reader::ReadArgument(uint8_t additional_info) {
    if (additional_info < 24) return static_cast<uint64_t>(additional_info);
    size_t width;
    switch (additional_info) {
        case 24: width = 1; break;
        case 25: width = 2; break;
        case 26: width = 4; break;
        case 27: width = 8; break;
        default: return util::Status::CborError("invalid additional info " + std::to_string(additional_info));
    }
    if (data_.size() - offset_ < width) return util::Status::CborError("unexpected end of input in item head");
    uint64_t value = 0;
    for (size_t i = 0; i < width; ++i) value = (value << 8) | data_[offset_++];
    return value;
}

util::StatusOr<std::vector<uint8_t>> Reader::ReadRaw(uint64_t length) {
    if (length > data_.size() - offset_) return util::Status::CborError("string length exceeds input");
    std::vector<uint8_t> out(data_.data() + offset_, data_.data() + offset_ + length);
    offset_ += length;
    return out;
}

util::StatusOr<std::vector<uint8_t>> Reader::ReadString(MajorType major, uint8_t additional_info) {
    if (additional_info != kIndefinite) {
        RAINMETA_ASSIGN_OR_RETURN(uint64_t length, ReadArgument(additional_info));
        return ReadRaw(length);
    }
    std::vector<uint8_t> out;
    while (true) {
        if (AtEnd()) return util::Status::CborError("unterminated indefinite-length string");
        if (PeekBreak()) {
            ++offset_;
            return out;
        }
        const uint8_t initial = data_[offset_++];
        if (static_cast<MajorType>(initial >> 5) != major || (initial & 0x1f) == kIndefinite) {
            return util::Status::CborError("invalid chunk in indefinite-length string");
        }
        RAINMETA_ASSIGN_OR_RETURN(uint64_t length, ReadArgument(initial & 0x1f));
        RAINMETA_ASSIGN_OR_RETURN(auto chunk, ReadRaw(length));
        out.insert(out.end(), chunk.begin(), chunk.end());
    }
}

util::StatusOr<Value> Reader::ReadItem(size_t depth) {
    if (depth > kMaxNestingDepth) return util::Status::CborError("nesting depth exceeded");
    if (AtEnd()) return util::Status::CborError("unexpected end of input");

    const uint8_t initial = data_[offset_++];
    const auto major = static_cast<MajorType>(initial >> 5);
    const uint8_t info = initial & 0x1f;

    switch (major) {
        case MajorType::kUnsigned: {
            RAINMETA_ASSIGN_OR_RETURN(uint64_t value, ReadArgument(info));
            return Value::Unsigned(value);
        }
        case MajorType::kNegative: {
            RAINMETA_ASSIGN_OR_RETURN(uint64_t value, ReadArgument(info));
            return Value::Negative(value);
        }
        case MajorType::kBytes: {
            RAINMETA_ASSIGN_OR_RETURN(auto bytes, ReadString(major, info));
            return Value::Bytes(std::move(bytes));
        }
        case MajorType::kText: {
            RAINMETA_ASSIGN_OR_RETURN(auto bytes, ReadString(major, info));
            return Value::Text(std::string(bytes.begin(), bytes.end()));
        }
        case MajorType::kArray: {
            Value::Array items;
            if (info == kIndefinite) {
                while (!PeekBreak()) {
                    RAINMETA_ASSIGN_OR_RETURN(Value item, ReadItem(depth + 1));
                    items.push_back(std::move(item));
                }
                ++offset_;
            } else {
                RAINMETA_ASSIGN_OR_RETURN(uint64_t count, ReadArgument(info));
                if (count > data_.size() - offset_) return util::Status::CborError("array length exceeds input");
                items.reserve(count);
                for (uint64_t i = 0; i < count; ++i) {
                    RAINMETA_ASSIGN_OR_RETURN(Value item, ReadItem(depth + 1));
                    items.push_back(std::move(item));
                }
            }
            return Value::MakeArray(std::move(items));
        }
        case MajorType::kMap: {
            Value::Map entries;
            if (info == kIndefinite) {
                while (!PeekBreak()) {
                    RAINMETA_ASSIGN_OR_RETURN(Value key, ReadItem(depth + 1));
                    RAINMETA_ASSIGN_OR_RETURN(Value item, ReadItem(depth + 1));
                    entries.emplace_back(std::move(key), std::move(item));
                }
                ++offset_;
            } else {
                RAINMETA_ASSIGN_OR_RETURN(uint64_t count, ReadArgument(info));
                if (count > (data_.size() - offset_) / 2) return util::Status::CborError("map length exceeds input");
                entries.reserve(count);
                for (uint64_t i = 0; i < count; ++i) {
                    RAINMETA_ASSIGN_OR_RETURN(Value key, ReadItem(depth + 1));
                    RAINMETA_ASSIGN_OR_RETURN(Value item, ReadItem(depth + 1));
                    entries.emplace_back(std::move(key), std::move(item));
                }
            }
            return Value::MakeMap(std::move(entries));
        }
        case MajorType::kTag: {
            RAINMETA_ASSIGN_OR_RETURN(uint64_t tag, ReadArgument(info));
            RAINMETA_ASSIGN_OR_RETURN(Value inner, ReadItem(depth + 1));
            return Value::Tagged(tag, std::move(inner));
        }
        case MajorType::kSimple:
            break;
    }

    switch (info) {
        case 20: return Value::Bool(false);
        case 21: return Value::Bool(true);
        case 22: return Value::Null();
        case 23: return Value::Undefined();
        case 24: {
            RAINMETA_ASSIGN_OR_RETURN(uint64_t simple, ReadArgument(info));
            if (simple < 32) return util::Status::CborError("invalid two-byte simple value");
            return Value::Simple(static_cast<uint8_t>(simple));
        }
        case 25: {
            RAINMETA_ASSIGN_OR_RETURN(uint64_t bits, ReadArgument(info));
            return Value::Float(HalfToDouble(static_cast<uint16_t>(bits)));
        }
        case 26: {
            RAINMETA_ASSIGN_OR_RETURN(uint64_t bits, ReadArgument(info));
            const uint32_t narrow = static_cast<uint32_t>(bits);
            float f;
            std::memcpy(&f, &narrow, sizeof(f));
            return Value::Float(f);
        }
        case 27: {
            RAINMETA_ASSIGN_OR_RETURN(uint64_t bits, ReadArgument(info));
            double d;
            std::memcpy(&d, &bits, sizeof(d));
            return Value::Float(d);
        }
        case kIndefinite:
            return util::Status::CborError("unexpected break");
        default:
            if (info < 20) return Value::Simple(info);
            return util::Status::CborError("reserved simple value encoding");
    }
}

std::vector<uint8_t> Encode(const Value& value) {
    std::vector<uint8_t> out;
    Writer(&out).Write(value);
    return out;
}

util::StatusOr<Value> DecodeOne(util::Span<const uint8_t> data) {
    Reader reader(data);
    RAINMETA_ASSIGN_OR_RETURN(Value value, reader.ReadValue());
    if (!reader.AtEnd()) return util::Status::CborError("trailing bytes after cbor item");
    return value;
}

}  // namespace rainmeta::v1::cbor
