#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace memorybank::common {

enum class ErrorCode {
  InvalidPath,
  PathEscape,
  UnknownFileType,
  NotFound,
  PermissionDenied,
  AlreadyExists,
  TransientIO,
  IoError,
  ValidationFailed,
  CacheInconsistency,
  HealthCheckFailed,
  ConfigError,
  IndexStoreError,
  Timeout,
  Unknown,
};

// Stable short names, matching the errno spelling where one exists.
[[nodiscard]] constexpr std::string_view error_code_name(const ErrorCode code) {
  switch (code) {
  case ErrorCode::InvalidPath:
    return "INVALID_PATH";
  case ErrorCode::PathEscape:
    return "PATH_ESCAPE";
  case ErrorCode::UnknownFileType:
    return "UNKNOWN_FILE_TYPE";
  case ErrorCode::NotFound:
    return "ENOENT";
  case ErrorCode::PermissionDenied:
    return "EACCES";
  case ErrorCode::AlreadyExists:
    return "EEXIST";
  case ErrorCode::TransientIO:
    return "TRANSIENT_EXHAUSTED";
  case ErrorCode::IoError:
    return "EIO";
  case ErrorCode::ValidationFailed:
    return "VALIDATION_FAILED";
  case ErrorCode::CacheInconsistency:
    return "CACHE_INCONSISTENCY";
  case ErrorCode::HealthCheckFailed:
    return "HEALTH_CHECK_FAILED";
  case ErrorCode::ConfigError:
    return "CONFIG_ERROR";
  case ErrorCode::IndexStoreError:
    return "INDEX_STORE_ERROR";
  case ErrorCode::Timeout:
    return "ETIMEDOUT";
  case ErrorCode::Unknown:
    return "UNKNOWN_ERROR";
  }
  return "UNKNOWN_ERROR";
}

struct Error {
  ErrorCode code = ErrorCode::Unknown;
  std::string message;
  std::optional<std::string> cause;

  [[nodiscard]] std::string describe() const {
    std::string out = std::string(error_code_name(code)) + ": " + message;
    if (cause.has_value()) {
      out += " (" + *cause + ")";
    }
    return out;
  }
};

class Status {
public:
  static Status success() { return Status(std::nullopt); }
  static Status error(std::string message) {
    return Status(Error{.code = ErrorCode::Unknown, .message = std::move(message), .cause = {}});
  }
  static Status error(ErrorCode code, std::string message,
                      std::optional<std::string> cause = std::nullopt) {
    return Status(Error{.code = code, .message = std::move(message), .cause = std::move(cause)});
  }
  static Status error(Error err) { return Status(std::move(err)); }

  [[nodiscard]] bool ok() const { return !error_.has_value(); }
  [[nodiscard]] const std::string &error() const { return ok() ? empty_message() : error_->message; }
  [[nodiscard]] ErrorCode code() const { return ok() ? ErrorCode::Unknown : error_->code; }
  [[nodiscard]] const Error &details() const {
    if (ok()) {
      throw std::logic_error("Status has no error");
    }
    return *error_;
  }

private:
  explicit Status(std::optional<Error> error) : error_(std::move(error)) {}

  static const std::string &empty_message() {
    static const std::string empty;
    return empty;
  }

  std::optional<Error> error_;
};

template <typename T> class Result {
public:
  static Result success(T value) { return Result(std::move(value), std::nullopt); }
  static Result failure(std::string message) {
    return Result(std::nullopt,
                  Error{.code = ErrorCode::Unknown, .message = std::move(message), .cause = {}});
  }
  static Result failure(ErrorCode code, std::string message,
                        std::optional<std::string> cause = std::nullopt) {
    return Result(std::nullopt,
                  Error{.code = code, .message = std::move(message), .cause = std::move(cause)});
  }
  static Result failure(Error err) { return Result(std::nullopt, std::move(err)); }

  [[nodiscard]] bool ok() const { return value_.has_value(); }

  [[nodiscard]] const T &value() const {
    if (!ok()) {
      throw std::logic_error("Result has no value: " + error_->message);
    }
    return *value_;
  }

  [[nodiscard]] T &value() {
    if (!ok()) {
      throw std::logic_error("Result has no value: " + error_->message);
    }
    return *value_;
  }

  [[nodiscard]] const std::string &error() const {
    static const std::string empty;
    return ok() ? empty : error_->message;
  }
  [[nodiscard]] ErrorCode code() const { return ok() ? ErrorCode::Unknown : error_->code; }
  [[nodiscard]] const Error &details() const {
    if (ok()) {
      throw std::logic_error("Result has no error");
    }
    return *error_;
  }

  [[nodiscard]] Status status() const { return ok() ? Status::success() : Status::error(*error_); }

private:
  Result(std::optional<T> value, std::optional<Error> error)
      : value_(std::move(value)), error_(std::move(error)) {}

  std::optional<T> value_;
  std::optional<Error> error_;
};

} // namespace memorybank::common
