#pragma once

#include <cstddef>
#include <utility>
#include <variant>

namespace injguard::core {

// Result<T, E> carries either a success value or a purpose-built error value (C++ Core
// Guidelines E.27). It is used where failure is an expected, recoverable outcome that the
// caller must inspect: local storage setup, and the response validator's Accepted/Rejected
// outcome. Operational faults that must abort a request are exceptions (see errors.h).
//
// Usage: Result<Value, Error>::ok(v) or Result<Value, Error>::err(e).
template <typename T, typename E>
class Result {
 public:
  static Result ok(T value) { return Result(std::in_place_index<0>, std::move(value)); }
  static Result err(E error) { return Result(std::in_place_index<1>, std::move(error)); }

  [[nodiscard]] bool has_value() const { return data_.index() == 0; }
  [[nodiscard]] const T& value() const { return std::get<0>(data_); }
  [[nodiscard]] const E& error() const { return std::get<1>(data_); }

 private:
  template <std::size_t I, typename V>
  Result(std::in_place_index_t<I> tag, V&& v) : data_(tag, std::forward<V>(v)) {}

  std::variant<T, E> data_;
};

}  // namespace injguard::core
