#pragma once

#include <cstddef>
#include <string>
#include <utility>
#include <variant>

namespace spanproof::core {

// Error enumerations following E.14 (use purpose-designed types as error indicators).
// kConfiguration: the rule set itself is wrong (bad range, bad glob, bad document).
// kTimeout: a readiness wait exceeded its deadline.
// A rule that is evaluated and not satisfied is never an Error; it is a Finding.
enum class ErrorKind {
  kConfiguration,
  kTimeout,
};

struct Error {
  ErrorKind kind{ErrorKind::kConfiguration};
  std::string message;

  static Error configuration(std::string message) {
    return Error{ErrorKind::kConfiguration, std::move(message)};
  }
  static Error timeout(std::string message) { return Error{ErrorKind::kTimeout, std::move(message)}; }
};

// Result<T, E> follows C++ Core Guidelines E.27: systematic error handling without exceptions.
// This type encodes success (T) or failure (E) explicitly, preventing ignored errors.
// Usage: return Result<Value, ErrorType>::ok(val) or Result<Value, ErrorType>::err(error).
template <typename T, typename E = Error>
class Result {
 public:
  static Result ok(T value) { return Result(std::in_place_index<0>, std::move(value)); }
  static Result err(E error) { return Result(std::in_place_index<1>, std::move(error)); }

  [[nodiscard]] bool has_value() const { return data_.index() == 0; }
  [[nodiscard]] const T& value() const { return std::get<0>(data_); }
  [[nodiscard]] T& value() { return std::get<0>(data_); }
  [[nodiscard]] const E& error() const { return std::get<1>(data_); }

 private:
  template <std::size_t I, typename V>
  Result(std::in_place_index_t<I> tag, V&& v) : data_(tag, std::forward<V>(v)) {}

  std::variant<T, E> data_;
};

}  // namespace spanproof::core
