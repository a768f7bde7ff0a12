#pragma once

#include "fsgate/common/error.hpp"

#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

namespace fsgate::common {

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
    return Result(code, std::nullopt, std::move(message));
  }
  static Result failure(const Status &status) {
    return Result(status.code(), std::nullopt, status.error());
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

} // namespace fsgate::common
