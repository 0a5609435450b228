#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

namespace sos::common {

enum class ErrorCode {
  None,
  InvalidArgument,
  NotFound,
  InvalidTransition,
  AdmissionExhausted,
  Runtime,
  SetupFailed,
  SessionTimeout,
  SessionClosed,
  Cancelled,
  Internal,
};

/// Stable snake_case name used in logs and API error bodies.
[[nodiscard]] constexpr const char *error_code_name(const ErrorCode code) {
  switch (code) {
  case ErrorCode::None:
    return "none";
  case ErrorCode::InvalidArgument:
    return "invalid_argument";
  case ErrorCode::NotFound:
    return "not_found";
  case ErrorCode::InvalidTransition:
    return "invalid_transition";
  case ErrorCode::AdmissionExhausted:
    return "admission_exhausted";
  case ErrorCode::Runtime:
    return "runtime_error";
  case ErrorCode::SetupFailed:
    return "setup_failed";
  case ErrorCode::SessionTimeout:
    return "session_timeout";
  case ErrorCode::SessionClosed:
    return "session_closed";
  case ErrorCode::Cancelled:
    return "cancelled";
  case ErrorCode::Internal:
    return "internal";
  }
  return "internal";
}

class Status {
public:
  static Status success() { return Status(ErrorCode::None, ""); }
  static Status error(std::string message) {
    return Status(ErrorCode::Internal, std::move(message));
  }
  static Status error(const ErrorCode code, std::string message) {
    return Status(code == ErrorCode::None ? ErrorCode::Internal : code, std::move(message));
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
  static Result failure(const ErrorCode code, std::string message) {
    return Result(code == ErrorCode::None ? ErrorCode::Internal : code, std::nullopt,
                  std::move(message));
  }
  static Result failure(const Status &status) {
    return failure(status.code(), status.error());
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

} // namespace sos::common
