// ====================================================================================
// RAINMETA - Status, StatusOr & Span
//
// Error values returned by every fallible operation in the library. Malformed
// external input never throws; it comes back as a Status with a typed code.
// ====================================================================================

#ifndef RAINMETA_STATUS_HPP_
#define RAINMETA_STATUS_HPP_

#include <cstdint>
#include <stdexcept>
#include <type_traits>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace rainmeta::util {

enum class StatusCode {
    kOk = 0,
    kError = 1,
    kNotFound = 2,
    kUnknownMagic = 3,
    kUnsupportedMeta = 4,
    kInvalidMetaMagic = 5,
    kCorruptMeta = 6,
    kInflateError = 7,
    kCborError = 8,
    kUtf8Error = 9,
    kJsonError = 10,
    kAbiError = 11,
    kBiggerThan32Bytes = 12,
    kDecodeHexStringError = 13,
    kInvalidInput = 14,
    kHashMismatch = 15,
    kResolverError = 16
};

const char* StatusCodeName(StatusCode code);

class Status {
public:
    Status() : code_(StatusCode::kOk) {}
    Status(StatusCode code, std::string message) : code_(code), message_(std::move(message)) {}
    static Status Ok() { return Status(); }
    static Status Error(std::string message) { return Status(StatusCode::kError, std::move(message)); }
    static Status NotFound(std::string message) { return Status(StatusCode::kNotFound, std::move(message)); }
    static Status UnknownMagic(std::string message) { return Status(StatusCode::kUnknownMagic, std::move(message)); }
    static Status UnsupportedMeta(std::string message) { return Status(StatusCode::kUnsupportedMeta, std::move(message)); }
    static Status InvalidMetaMagic(const std::string& expected, const std::string& actual) {
        return Status(StatusCode::kInvalidMetaMagic, "invalid meta magic, expected " + expected + ", got " + actual);
    }
    static Status CorruptMeta() { return Status(StatusCode::kCorruptMeta, "corrupt meta"); }
    static Status InflateError(std::string message) { return Status(StatusCode::kInflateError, std::move(message)); }
    static Status CborError(std::string message) { return Status(StatusCode::kCborError, std::move(message)); }
    static Status Utf8Error(std::string message) { return Status(StatusCode::kUtf8Error, std::move(message)); }
    static Status JsonError(std::string message) { return Status(StatusCode::kJsonError, std::move(message)); }
    static Status AbiError(std::string message) { return Status(StatusCode::kAbiError, std::move(message)); }
    static Status BiggerThan32Bytes() { return Status(StatusCode::kBiggerThan32Bytes, "string is bigger than 32 bytes"); }
    static Status DecodeHexStringError(std::string message) { return Status(StatusCode::kDecodeHexStringError, std::move(message)); }
    static Status InvalidInput(std::string message) { return Status(StatusCode::kInvalidInput, std::move(message)); }
    static Status HashMismatch(std::string message) { return Status(StatusCode::kHashMismatch, std::move(message)); }
    static Status ResolverError(std::string message) { return Status(StatusCode::kResolverError, std::move(message)); }
    bool ok() const { return code_ == StatusCode::kOk; }
    const std::string& message() const { return message_; }
    StatusCode code() const { return code_; }
    std::string ToString() const;
private:
    StatusCode code_;
    std::string message_;
};

template <typename T>
class StatusOr {
public:
    StatusOr(Status status) : data_(std::move(status)) {
        if (std::get<Status>(data_).ok()) data_ = Status::Error("StatusOr constructed from an Ok status");
    }
    StatusOr(T value) : data_(std::move(value)) {}
    bool ok() const { return std::holds_alternative<T>(data_); }
    Status status() const { return ok() ? Status::Ok() : std::get<Status>(data_); }
    const T& value() const {
        if (!ok()) throw std::runtime_error("Accessing value on error StatusOr: " + status().message());
        return std::get<T>(data_);
    }
    T& value() {
        if (!ok()) throw std::runtime_error("Accessing value on error StatusOr: " + status().message());
        return std::get<T>(data_);
    }
private:
    std::variant<T, Status> data_;
};

template <typename T>
class Span {
 public:
  Span() : data_(nullptr), size_(0) {}
  Span(const std::vector<typename std::remove_const<T>::type>& vec) : data_(vec.data()), size_(vec.size()) {}
  Span(const T* data, size_t size) : data_(data), size_(size) {}
  const T* data() const { return data_; }
  size_t size() const { return size_; }
  bool empty() const { return size_ == 0; }
  const T& operator[](size_t index) const { return data_[index]; }
  const T* begin() const { return data_; }
  const T* end() const { return data_ + size_; }
  Span subspan(size_t offset) const { return offset >= size_ ? Span() : Span(data_ + offset, size_ - offset); }
 private:
  const T* data_;
  size_t size_;
};

#define RAINMETA_STATUS_CONCAT_INNER_(a, b) a##b
#define RAINMETA_STATUS_CONCAT_(a, b) RAINMETA_STATUS_CONCAT_INNER_(a, b)

#define RAINMETA_RETURN_IF_ERROR(expr) \
    do { const ::rainmeta::util::Status _rainmeta_status = (expr); if (!_rainmeta_status.ok()) return _rainmeta_status; } while (false)

#define RAINMETA_ASSIGN_OR_RETURN(lhs, rexpr) \
    RAINMETA_ASSIGN_OR_RETURN_IMPL_(RAINMETA_STATUS_CONCAT_(_rainmeta_status_or_, __LINE__), lhs, rexpr)

#define RAINMETA_ASSIGN_OR_RETURN_IMPL_(tmp, lhs, rexpr) \
    auto tmp = (rexpr); \
    if (!tmp.ok()) return tmp.status(); \
    lhs = std::move(tmp.value())

}  // namespace rainmeta::util

#endif  // RAINMETA_STATUS_HPP_
