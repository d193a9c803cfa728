#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

namespace lxcforge::common {

/// Outcome of an operation that produces nothing: success, or a failure message.
class Status {
public:
  static Status success() { return Status(false, ""); }
  static Status error(std::string message) { return Status(true, std::move(message)); }

  [[nodiscard]] bool ok() const { return !failed_; }
  [[nodiscard]] const std::string &error() const { return message_; }

private:
  Status(bool failed, std::string message) : failed_(failed), message_(std::move(message)) {}

  bool failed_;
  std::string message_;
};

/// A value of type T, or the message explaining why there is none. Reading the value of a
/// failed Result is a programming error and throws std::logic_error.
template <typename T> class Result {
public:
  static Result success(T value) { return Result(std::move(value), ""); }
  static Result failure(std::string message) { return Result(std::nullopt, std::move(message)); }

  [[nodiscard]] bool ok() const { return value_.has_value(); }

  [[nodiscard]] const T &value() const {
    require_value();
    return *value_;
  }

  [[nodiscard]] T &value() {
    require_value();
    return *value_;
  }

  [[nodiscard]] const std::string &error() const { return message_; }

private:
  Result(std::optional<T> value, std::string message)
      : value_(std::move(value)), message_(std::move(message)) {}

  void require_value() const {
    if (!value_.has_value()) {
      throw std::logic_error("Result has no value: " + message_);
    }
  }

  std::optional<T> value_;
  std::string message_;
};

} // namespace lxcforge::common
