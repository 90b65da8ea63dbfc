#pragma once

#include <cstddef>
#include <string_view>
#include <utility>
#include <variant>

namespace sfid::core {

// Error enumerations following E.14 (use purpose-designed types as error indicators).
// These domain-specific errors carry semantic meaning beyond built-in error codes.

// SnowflakeError covers every failure of identifier generation.
// None of them is retried internally; the caller decides whether to retry or abort.
enum class SnowflakeError {
  kEpochOrdering,      // clock reads earlier than the custom epoch
  kTimestampOverflow,  // elapsed milliseconds do not fit in 64 bits
  kRandomSource,       // the random source could not produce a value
};

enum class ParseError {
  kInvalidFormat,
};

// Stable names for diagnostics ("epoch_ordering", "timestamp_overflow", ...).
constexpr std::string_view to_string(const SnowflakeError error) {
  switch (error) {
    case SnowflakeError::kEpochOrdering:
      return "epoch_ordering";
    case SnowflakeError::kTimestampOverflow:
      return "timestamp_overflow";
    case SnowflakeError::kRandomSource:
      return "random_source";
  }
  return "unknown";
}

constexpr std::string_view to_string(const ParseError error) {
  switch (error) {
    case ParseError::kInvalidFormat:
      return "invalid_format";
  }
  return "unknown";
}

// Result<T, E> follows C++ Core Guidelines E.27: systematic error handling without exceptions.
// This type encodes success (T) or failure (E) explicitly, preventing ignored errors.
// Usage: return Result<Value, ErrorType>::ok(val) or Result<Value, ErrorType>::err(error).
// The has_value() check makes error handling mandatory and visible at call sites.
template <typename T, typename E>
class Result {
 public:
  static Result ok(T value) { return Result(std::in_place_index<0>, std::move(value)); }
  static Result err(E error) { return Result(std::in_place_index<1>, std::move(error)); }

  [[nodiscard]] bool has_value() const { return data_.index() == 0; }
  [[nodiscard]] const T& value() const { return std::get<0>(data_); }
  [[nodiscard]] const E& error() const { return std::get<1>(data_); }

 private:
  // Index-based construction keeps T and E distinguishable even when both are integral.
  template <std::size_t I, typename V>
  Result(std::in_place_index_t<I> index, V&& v) : data_(index, std::forward<V>(v)) {}

  std::variant<T, E> data_;
};

}  // namespace sfid::core
