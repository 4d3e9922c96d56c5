#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace engram::common {

enum class ErrorCode {
  None,
  Validation,
  NotFound,
  Unavailable,
  Disabled,
  Storage,
  Internal,
};

[[nodiscard]] inline std::string_view error_code_name(const ErrorCode code) {
  switch (code) {
  case ErrorCode::None:
    return "none";
  case ErrorCode::Validation:
    return "validation";
  case ErrorCode::NotFound:
    return "not_found";
  case ErrorCode::Unavailable:
    return "unavailable";
  case ErrorCode::Disabled:
    return "disabled";
  case ErrorCode::Storage:
    return "storage";
  case ErrorCode::Internal:
    return "internal";
  }
  return "internal";
}

class Status {
public:
  static Status success() { return Status(ErrorCode::None, ""); }
  static Status error(std::string message, ErrorCode code = ErrorCode::Internal) {
    return Status(code, std::move(message));
  }

  [[nodiscard]] bool ok() const { return code_ == ErrorCode::None; }
  [[nodiscard]] ErrorCode code() const { return code_; }
  [[nodiscard]] const std::string &error() const { return error_; }

private:
  Status(ErrorCode code, std::string error) : code_(code), error_(std::move(error)) {}

  ErrorCode code_;
  std::string error_;
};

template <typename T> class Result {
public:
  static Result success(T value) { return Result(ErrorCode::None, std::move(value), ""); }
  static Result failure(std::string message, ErrorCode code = ErrorCode::Internal) {
    return Result(code, std::nullopt, std::move(message));
  }
  template <typename U> static Result failure_from(const Result<U> &other) {
    return failure(other.error(), other.code());
  }
  static Result failure_from(const Status &status) {
    return failure(status.error(), status.code());
  }

  [[nodiscard]] bool ok() const { return code_ == ErrorCode::None; }
  [[nodiscard]] ErrorCode code() const { return code_; }

  [[nodiscard]] const T &value() const {
    if (!ok()) {
      throw std::logic_error("Result has no value: " + error_);
    }
    return *value_;
  }

  [[nodiscard]] T &value() {
    if (!ok()) {
      throw std::logic_error("Result has no value: " + error_);
    }
    return *value_;
  }

  [[nodiscard]] const std::string &error() const { return error_; }

private:
  Result(ErrorCode code, std::optional<T> value, std::string error)
      : code_(code), value_(std::move(value)), error_(std::move(error)) {}

  ErrorCode code_;
  std::optional<T> value_;
  std::string error_;
};

} // namespace engram::common
