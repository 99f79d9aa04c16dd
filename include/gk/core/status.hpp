// include/gk/core/status.hpp
#pragma once

#include <optional>
#include <string>
#include <type_traits>
#include <utility>

namespace gk {

class Status {
 public:
  enum class Code : int {
    kOk = 0,

    // Caller errors
    kInvalidArgument,
    kOutOfRange,

    // Environment / IO
    kNotFound,
    kIoError,
    kPermissionDenied,

    // Data / parsing
    kParseError,
    kCorruptData,
    kSchemaInvalid,

    // System / unexpected
    kUnsupported,
    kInternal,
  };

  Status() = default;  // OK
  Status(Code code, std::string message)
      : code_(code), message_(std::move(message)) {}

  [[nodiscard]] bool ok() const noexcept { return code_ == Code::kOk; }
  [[nodiscard]] Code code() const noexcept { return code_; }
  [[nodiscard]] const std::string& message() const noexcept { return message_; }

  static Status ok_status() { return Status(); }

  static Status invalid_argument(std::string msg) { return Status(Code::kInvalidArgument, std::move(msg)); }
  static Status out_of_range(std::string msg) { return Status(Code::kOutOfRange, std::move(msg)); }
  static Status not_found(std::string msg) { return Status(Code::kNotFound, std::move(msg)); }
  static Status io_error(std::string msg) { return Status(Code::kIoError, std::move(msg)); }
  static Status permission_denied(std::string msg) { return Status(Code::kPermissionDenied, std::move(msg)); }
  static Status parse_error(std::string msg) { return Status(Code::kParseError, std::move(msg)); }
  static Status corrupt_data(std::string msg) { return Status(Code::kCorruptData, std::move(msg)); }
  static Status schema_invalid(std::string msg) { return Status(Code::kSchemaInvalid, std::move(msg)); }
  static Status unsupported(std::string msg) { return Status(Code::kUnsupported, std::move(msg)); }
  static Status internal(std::string msg) { return Status(Code::kInternal, std::move(msg)); }

 private:
  Code code_ = Code::kOk;
  std::string message_;
};

const char* status_code_name(Status::Code code) noexcept;

// Value-or-error. E defaults to Status; the admission path uses a typed
// ValidationFailure instead.
template <typename T, typename E = Status>
class Result {
 public:
  Result() = delete;

  static Result ok(T value) { return Result(std::in_place_index<0>, std::move(value)); }
  static Result err(E error) { return Result(std::in_place_index<1>, std::move(error)); }

  [[nodiscard]] bool ok() const noexcept { return value_.has_value(); }

  [[nodiscard]] const E& error() const { return error_.value(); }
  [[nodiscard]] E& error() { return error_.value(); }

  [[nodiscard]] const Status& status() const noexcept
    requires std::is_same_v<E, Status>
  {
    return error_ ? *error_ : kOkStatus;
  }

  [[nodiscard]] const T* value_if_ok() const noexcept { return ok() ? &(*value_) : nullptr; }
  [[nodiscard]] T* value_if_ok() noexcept { return ok() ? &(*value_) : nullptr; }

  [[nodiscard]] const T& value() const { return value_.value(); }
  [[nodiscard]] T& value() { return value_.value(); }

  [[nodiscard]] const T& operator*() const { return value(); }
  [[nodiscard]] T& operator*() { return value(); }

  [[nodiscard]] const T* operator->() const { return &value(); }
  [[nodiscard]] T* operator->() { return &value(); }

  [[nodiscard]] T take_value() { return std::move(value_.value()); }
  [[nodiscard]] E take_error() { return std::move(error_.value()); }

 private:
  Result(std::in_place_index_t<0>, T value) : value_(std::move(value)) {}
  Result(std::in_place_index_t<1>, E error) : error_(std::move(error)) {}

  inline static const Status kOkStatus{};

  std::optional<T> value_;
  std::optional<E> error_;
};

#define GK_RETURN_IF_ERROR(expr)      \
  do {                                \
    const ::gk::Status _s = (expr);   \
    if (!_s.ok()) return _s;          \
  } while (0)

}  // namespace gk
