#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

namespace prdguard::common {

class Status {
public:
  static Status success() { return Status(true, "", ""); }
  static Status error(std::string message, std::string threat = "") {
    return Status(false, std::move(message), std::move(threat));
  }

  [[nodiscard]] bool ok() const { return ok_; }
  [[nodiscard]] const std::string &error() const { return error_; }
  [[nodiscard]] const std::string &threat() const { return threat_; }

private:
  Status(bool ok, std::string error, std::string threat)
      : ok_(ok), error_(std::move(error)), threat_(std::move(threat)) {}

  bool ok_;
  std::string error_;
  std::string threat_;
};

/// Either a value or an error message with an optional threat tag. Callers branch on
/// ok() before touching value(); reading the value of a failure is a logic error.
template <typename T> class Result {
public:
  static Result success(T value) { return Result(true, std::move(value), "", ""); }
  static Result failure(std::string message, std::string threat = "") {
    return Result(false, std::nullopt, std::move(message), std::move(threat));
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

  [[nodiscard]] const std::string &error() const { return error_; }
  [[nodiscard]] const std::string &threat() const { return threat_; }

  template <typename U> [[nodiscard]] Result<U> forward_failure() const {
    return Result<U>::failure(error_, threat_);
  }

private:
  Result(bool ok, std::optional<T> value, std::string error, std::string threat)
      : ok_(ok), value_(std::move(value)), error_(std::move(error)), threat_(std::move(threat)) {}

  bool ok_;
  std::optional<T> value_;
  std::string error_;
  std::string threat_;
};

template <> class Result<void> {
public:
  static Result success() { return Result(true, "", ""); }
  static Result failure(std::string message, std::string threat = "") {
    return Result(false, std::move(message), std::move(threat));
  }

  [[nodiscard]] bool ok() const { return ok_; }
  [[nodiscard]] const std::string &error() const { return error_; }
  [[nodiscard]] const std::string &threat() const { return threat_; }

private:
  Result(bool ok, std::string error, std::string threat)
      : ok_(ok), error_(std::move(error)), threat_(std::move(threat)) {}

  bool ok_;
  std::string error_;
  std::string threat_;
};

/// Validation outcome shared by every trust-boundary component.
template <typename T> using SecurityResult = Result<T>;

} // namespace prdguard::common
