#pragma once

#include <cstddef>
#include <utility>
#include <variant>

namespace ftr::core {

// Result<T, E> carries either a value or a domain error. Every fallible operation in the
// engine returns one, so the failure path is visible at the call site and cannot be ignored.
// Usage: return Result<Value, Error>::ok(val) or Result<Value, Error>::err(error).
template <typename T, typename E>
class Result {
 public:
  using value_type = T;
  using error_type = E;

  static Result ok(T value) { return Result(std::in_place_index<0>, std::move(value)); }
  static Result err(E error) { return Result(std::in_place_index<1>, std::move(error)); }

  [[nodiscard]] bool has_value() const { return data_.index() == 0; }
  [[nodiscard]] const T& value() const& { return std::get<0>(data_); }
  [[nodiscard]] T&& value() && { return std::get<0>(std::move(data_)); }
  [[nodiscard]] const E& error() const { return std::get<1>(data_); }

 private:
  template <std::size_t I, typename V>
  Result(std::in_place_index_t<I> tag, V&& v) : data_(tag, std::forward<V>(v)) {}

  std::variant<T, E> data_;
};

}  // namespace ftr::core
