#pragma once

#include "dynamap/base/error.hpp"

#include <cassert>
#include <expected>
#include <type_traits>
#include <utility>
#include <variant>

namespace dynamap {

#ifdef DEBUG
#define DYNAMAP_DCHECK_HAS_VALUE assert(has_value() && "No value present in Result");
#define DYNAMAP_DCHECK_HAS_ERROR assert(!has_value() && "No error present in Result");
#else
#define DYNAMAP_DCHECK_HAS_VALUE
#define DYNAMAP_DCHECK_HAS_ERROR
#endif

template <typename T>
struct ResultStorageType {
  using type = T;
};

template <>
struct ResultStorageType<void> {
  using type = std::monostate;
};

/// A Result type that encapsulates either a value of type T or an Error.
/// All APIs are mimicked after std::expected.
template <typename T, typename E = Error>
class [[nodiscard]] Result {
public:
  /// Actual underlying std::expected type.
  using storage_t = typename ResultStorageType<T>::type;
  using result_t = std::expected<storage_t, E>;

  /// Construct from std::expected
  /// No explicit in order to allow implicit conversions.
  Result(result_t&& result) : result_(std::move(result)) { // NOLINT (google-explicit-constructor)
  }

  /// Construct an empty Result for void type.
  Result()
    requires std::is_void_v<T>
      : result_(std::expected<storage_t, E>{}) {
  }

  /// Construct a value Result. Moves the value.
  /// No explicit in order to allow implicit conversions.
  Result(storage_t&& v) : result_(std::move(v)) { // NOLINT (google-explicit-constructor)
  }

  /// Construct a value Result (const version). Copies the value.
  /// No explicit in order to allow implicit conversions.
  Result(const storage_t& v) : result_(v) { // NOLINT (google-explicit-constructor)
  }

  /// Construct an error Result.
  /// No explicit in order to allow implicit conversions.
  Result(E&& e) : result_(std::unexpected(std::move(e))) { // NOLINT (google-explicit-constructor)
  }

  /// Construct an error Result from a copied error, used when the same error
  /// is reported to several callers.
  Result(const E& e) : result_(std::unexpected(e)) { // NOLINT (google-explicit-constructor)
  }

  /// Checks if the Result contains a value
  constexpr bool has_value() const noexcept { // NOLINT: mimicking std::expected
    return result_.has_value();
  }

  /// Operator bool to check if it has value
  explicit operator bool() const noexcept {
    return has_value();
  }

  /// Checks whether two Results are equal
  friend bool operator==(const Result& lhs, const Result& rhs) noexcept {
    return lhs.result_ == rhs.result_;
  }

  /// Checks whether two Results are not equal
  friend bool operator!=(const Result& lhs, const Result& rhs) noexcept {
    return !(lhs == rhs);
  }

  /// Gets the value.
  constexpr storage_t& value() & { // NOLINT: mimicking std::expected
    DYNAMAP_DCHECK_HAS_VALUE;
    return result_.value();
  }

  /// Gets the value (const version).
  constexpr const storage_t& value() const& { // NOLINT: mimicking std::expected
    DYNAMAP_DCHECK_HAS_VALUE;
    return result_.value();
  }

  /// Gets the value if present, otherwise the given fallback.
  template <typename U>
  constexpr storage_t value_or(U&& fallback) const& { // NOLINT: mimicking std::expected
    return result_.value_or(std::forward<U>(fallback));
  }

  /// Gets the error.
  constexpr E& error() & { // NOLINT: mimicking std::expected
    DYNAMAP_DCHECK_HAS_ERROR;
    return result_.error();
  }

  /// Gets the error (const version).
  constexpr const E& error() const& { // NOLINT: mimicking std::expected
    DYNAMAP_DCHECK_HAS_ERROR
    return result_.error();
  }

private:
  /// The underlying std::expected instance.
  result_t result_;
};

#undef DYNAMAP_DCHECK_HAS_VALUE
#undef DYNAMAP_DCHECK_HAS_ERROR

#define DYNAMAP_RESULT_CONCAT_INTERNAL(a, b) a##b
#define DYNAMAP_RESULT_CONCAT(a, b) DYNAMAP_RESULT_CONCAT_INTERNAL(a, b)

/// Evaluates an expression returning a Result, returns its error from the
/// enclosing function on failure.
#define DYNAMAP_RETURN_IF_ERROR(expr)                                                              \
  do {                                                                                             \
    auto dynamap_res_ = (expr);                                                                    \
    if (!dynamap_res_) {                                                                           \
      return std::move(dynamap_res_.error());                                                      \
    }                                                                                              \
  } while (0)

#define DYNAMAP_ASSIGN_OR_RETURN_INTERNAL(tmp, lhs, expr)                                          \
  auto tmp = (expr);                                                                               \
  if (!tmp) {                                                                                      \
    return std::move(tmp.error());                                                                 \
  }                                                                                                \
  lhs = std::move(tmp.value());

/// Evaluates an expression returning a Result, moves the value into lhs or
/// returns the error from the enclosing function.
#define DYNAMAP_ASSIGN_OR_RETURN(lhs, expr)                                                        \
  DYNAMAP_ASSIGN_OR_RETURN_INTERNAL(DYNAMAP_RESULT_CONCAT(dynamap_tmp_at_line, __LINE__), lhs, expr)

} // namespace dynamap
