#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace warden::common {

enum class ErrorKind {
  None,
  ConfigFetch,
  SandboxProvision,
  ColdStart,
  Proxy,
  Flush,
  Invalid,
  Internal,
};

[[nodiscard]] constexpr std::string_view error_kind_name(const ErrorKind kind) {
  switch (kind) {
  case ErrorKind::None:
    return "none";
  case ErrorKind::ConfigFetch:
    return "config_fetch";
  case ErrorKind::SandboxProvision:
    return "sandbox_provision";
  case ErrorKind::ColdStart:
    return "cold_start";
  case ErrorKind::Proxy:
    return "proxy";
  case ErrorKind::Flush:
    return "flush";
  case ErrorKind::Invalid:
    return "invalid";
  case ErrorKind::Internal:
    return "internal";
  }
  return "internal";
}

/// Failure details shared by Status and Result. Diagnostics carry operator-facing
/// text (log tails, process lists) and are empty for degrade-and-continue errors.
struct Error {
  ErrorKind kind = ErrorKind::None;
  std::string message;
  std::string diagnostics;
};

class Status {
public:
  static Status success() { return Status(Error{}); }
  static Status error(std::string message, ErrorKind kind = ErrorKind::Internal,
                      std::string diagnostics = "") {
    return Status(Error{kind, std::move(message), std::move(diagnostics)});
  }
  static Status from(Error error) { return Status(std::move(error)); }

  [[nodiscard]] bool ok() const { return error_.kind == ErrorKind::None; }
  [[nodiscard]] const std::string &error() const { return error_.message; }
  [[nodiscard]] ErrorKind kind() const { return error_.kind; }
  [[nodiscard]] const std::string &diagnostics() const { return error_.diagnostics; }
  [[nodiscard]] const Error &details() const { return error_; }

private:
  explicit Status(Error error) : error_(std::move(error)) {
    if (error_.kind == ErrorKind::None && !error_.message.empty()) {
      error_.kind = ErrorKind::Internal;
    }
  }

  Error error_;
};

template <typename T> class Result {
public:
  static Result success(T value) { return Result(std::move(value), Error{}); }
  static Result failure(std::string message, ErrorKind kind = ErrorKind::Internal,
                        std::string diagnostics = "") {
    return Result(std::nullopt, Error{kind, std::move(message), std::move(diagnostics)});
  }
  static Result failure(Error error) {
    if (error.kind == ErrorKind::None) {
      error.kind = ErrorKind::Internal;
    }
    return Result(std::nullopt, std::move(error));
  }

  [[nodiscard]] bool ok() const { return value_.has_value(); }

  [[nodiscard]] const T &value() const {
    if (!ok()) {
      throw std::logic_error("Result has no value: " + error_.message);
    }
    return *value_;
  }

  [[nodiscard]] T &value() {
    if (!ok()) {
      throw std::logic_error("Result has no value: " + error_.message);
    }
    return *value_;
  }

  [[nodiscard]] const std::string &error() const { return error_.message; }
  [[nodiscard]] ErrorKind kind() const { return error_.kind; }
  [[nodiscard]] const std::string &diagnostics() const { return error_.diagnostics; }
  [[nodiscard]] const Error &details() const { return error_; }

private:
  Result(std::optional<T> value, Error error) : value_(std::move(value)), error_(std::move(error)) {}

  std::optional<T> value_;
  Error error_;
};

} // namespace warden::common
