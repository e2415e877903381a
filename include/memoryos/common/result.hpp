#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace memoryos::common {

enum class ErrorCode {
  None,
  Internal,
  InvalidArgument,
  NotFound,
  EncodingError,
  DimensionMismatch,
  IngestionFailed,
  CorruptIndex,
  Database,
  Io,
  Unavailable,
};

[[nodiscard]] constexpr std::string_view error_code_name(const ErrorCode code) {
  switch (code) {
  case ErrorCode::None:
    return "none";
  case ErrorCode::Internal:
    return "internal";
  case ErrorCode::InvalidArgument:
    return "invalid_argument";
  case ErrorCode::NotFound:
    return "not_found";
  case ErrorCode::EncodingError:
    return "encoding_error";
  case ErrorCode::DimensionMismatch:
    return "dimension_mismatch";
  case ErrorCode::IngestionFailed:
    return "ingestion_failed";
  case ErrorCode::CorruptIndex:
    return "corrupt_index";
  case ErrorCode::Database:
    return "database";
  case ErrorCode::Io:
    return "io";
  case ErrorCode::Unavailable:
    return "unavailable";
  }
  return "internal";
}

class Status {
public:
  static Status success() { return Status(ErrorCode::None, ""); }
  static Status error(std::string message) {
    return Status(ErrorCode::Internal, std::move(message));
  }
  static Status error(ErrorCode code, std::string message) {
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
  static Result failure(std::string message) {
    return Result(ErrorCode::Internal, std::nullopt, std::move(message));
  }
  static Result failure(ErrorCode code, std::string message) {
    return Result(code == ErrorCode::None ? ErrorCode::Internal : code, std::nullopt,
                  std::move(message));
  }
  /// Carries a failed Status (or another Result's error) across value types.
  static Result failure(const Status &status) { return failure(status.code(), status.error()); }

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
  [[nodiscard]] Status status() const {
    return ok() ? Status::success() : Status::error(code_, error_);
  }

private:
  Result(ErrorCode code, std::optional<T> value, std::string error)
      : code_(code), value_(std::move(value)), error_(std::move(error)) {}

  ErrorCode code_;
  std::optional<T> value_;
  std::string error_;
};

/// "<code>: <message>" for reporting errors that get wrapped by a caller.
[[nodiscard]] inline std::string describe(const Status &status) {
  return std::string(error_code_name(status.code())) + ": " + status.error();
}

} // namespace memoryos::common
