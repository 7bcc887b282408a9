#pragma once

#include <utility>
#include <variant>

namespace budgetam::core {

// Result<T, E> follows C++ Core Guidelines E.27: systematic error handling without exceptions.
// A fatal problem with one workbook is returned to the caller as an E value; it never
// terminates the process, so a batch driver can decide what to do with the failure.
// Usage: return Result<Value, ErrorType>::ok(val) or Result<Value, ErrorType>::err(error).
template <typename T, typename E>
class Result {
 public:
  static Result ok(T value) { return Result(std::move(value)); }
  static Result err(E error) { return Result(std::move(error)); }

  [[nodiscard]] bool has_value() const { return std::holds_alternative<T>(data_); }
  [[nodiscard]] const T& value() const { return std::get<T>(data_); }
  [[nodiscard]] T& value() { return std::get<T>(data_); }
  [[nodiscard]] const E& error() const { return std::get<E>(data_); }

 private:
  explicit Result(T value) : data_(std::in_place_index<0>, std::move(value)) {}
  explicit Result(E error) : data_(std::in_place_index<1>, std::move(error)) {}

  std::variant<T, E> data_;
};

}  // namespace budgetam::core
