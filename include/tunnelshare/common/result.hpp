#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace tunnelshare::common {

enum class ErrorKind {
  Internal,
  PortAllocationFailure,
  BindFailure,
  AgentMissing,
  TunnelSpawnFailure,
  AuthFailure,
  RateLimited,
  RequestTimeout,
  NotFound,
  Io,
  InvalidPackage,
  Database,
  Network,
  Config,
  InvalidArgument,
};

[[nodiscard]] std::string_view error_kind_name(ErrorKind kind);

class Status {
public:
  static Status success() { return Status(true, ErrorKind::Internal, ""); }
  static Status error(std::string message) {
    return Status(false, ErrorKind::Internal, std::move(message));
  }
  static Status error(ErrorKind kind, std::string message) {
    return Status(false, kind, std::move(message));
  }

  [[nodiscard]] bool ok() const { return ok_; }
  [[nodiscard]] ErrorKind kind() const { return kind_; }
  [[nodiscard]] const std::string &error() const { return error_; }

private:
  Status(bool ok, ErrorKind kind, std::string error)
      : ok_(ok), kind_(kind), error_(std::move(error)) {}

  bool ok_;
  ErrorKind kind_;
  std::string error_;
};

template <typename T> class Result {
public:
  static Result success(T value) {
    return Result(true, std::move(value), ErrorKind::Internal, "");
  }
  static Result failure(std::string message) {
    return Result(false, std::nullopt, ErrorKind::Internal, std::move(message));
  }
  static Result failure(ErrorKind kind, std::string message) {
    return Result(false, std::nullopt, kind, std::move(message));
  }
  static Result failure(const Status &status) {
    return Result(false, std::nullopt, status.kind(), status.error());
  }

  [[nodiscard]] bool ok() const { return ok_; }

  [[nodiscard]] const T &value() const {
    if (!ok_) {
      throw std::logic_error("Result has no value: " + error_);
    }
    return *value_;
  }

  [[nodiscard]] T &value() {
    if (!ok_) {
      throw std::logic_error("Result has no value: " + error_);
    }
    return *value_;
  }

  [[nodiscard]] ErrorKind kind() const { return kind_; }
  [[nodiscard]] const std::string &error() const { return error_; }
  [[nodiscard]] Status status() const {
    return ok_ ? Status::success() : Status::error(kind_, error_);
  }

private:
  Result(bool ok, std::optional<T> value, ErrorKind kind, std::string error)
      : ok_(ok), value_(std::move(value)), kind_(kind), error_(std::move(error)) {}

  bool ok_;
  std::optional<T> value_;
  ErrorKind kind_;
  std::string error_;
};

} // namespace tunnelshare::common
