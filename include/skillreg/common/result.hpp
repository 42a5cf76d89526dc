#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>

namespace skillreg::common {

class Status {
public:
  static Status success() { return Status(true, ""); }
  static Status error(std::string message) { return Status(false, std::move(message)); }

  [[nodiscard]] bool ok() const { return ok_; }
  [[nodiscard]] const std::string &error() const { return error_; }

private:
  Status(bool ok, std::string error) : ok_(ok), error_(std::move(error)) {}

  bool ok_;
  std::string error_;
};

/// Value-or-error. E defaults to a plain message; typed errors (e.g. ValidationError) are
/// allowed as long as they are default constructible.
template <typename T, typename E = std::string> class Result {
public:
  static Result success(T value) { return Result(true, std::move(value), E{}); }
  static Result failure(E error) { return Result(false, std::nullopt, std::move(error)); }

  [[nodiscard]] bool ok() const { return ok_; }

  [[nodiscard]] const T &value() const {
    if (!ok_) {
      throw std::logic_error(describe());
    }
    return *value_;
  }

  [[nodiscard]] T &value() {
    if (!ok_) {
      throw std::logic_error(describe());
    }
    return *value_;
  }

  [[nodiscard]] const E &error() const { return error_; }

private:
  Result(bool ok, std::optional<T> value, E error)
      : ok_(ok), value_(std::move(value)), error_(std::move(error)) {}

  [[nodiscard]] std::string describe() const {
    if constexpr (std::is_convertible_v<E, std::string>) {
      return "Result has no value: " + std::string(error_);
    } else {
      return "Result has no value";
    }
  }

  bool ok_;
  std::optional<T> value_;
  E error_;
};

} // namespace skillreg::common
