#pragma once

#include <utility>
#include <variant>

namespace snowgen::core {

// Result<T, E> carries either a parsed value or the reason parsing failed.
// snowgen_cli returns it from flag and SNOWGEN_* environment parsing, where
// bad input is expected and the caller prints E and exits with code 1.
// The generator itself never returns one: ClockRegressionError and
// ConfigurationError are thrown.
// T and E must be distinct types, otherwise ok() and err() are ambiguous.
template <typename T, typename E>
class Result {
 public:
  static Result ok(T value) { return Result(std::move(value)); }
  static Result err(E error) { return Result(std::move(error)); }

  [[nodiscard]] bool has_value() const { return std::holds_alternative<T>(data_); }
  [[nodiscard]] const T& value() const { return std::get<T>(data_); }
  [[nodiscard]] const E& error() const { return std::get<E>(data_); }

 private:
  explicit Result(T value) : data_(std::move(value)) {}
  explicit Result(E error) : data_(std::move(error)) {}

  std::variant<T, E> data_;
};

}  // namespace snowgen::core
