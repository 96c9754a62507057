#pragma once

#include "dynamap/value/attribute_value.hpp"
#include "dynamap/value/date_time.hpp"

#include <concepts>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <type_traits>
#include <variant>
#include <vector>

namespace dynamap {

class Document;

/// Domain-side value kinds a field of a domain object may hold.
enum class ValueKind : uint8_t {
  kUnset = 0,
  kBool,
  kInteger,
  kDecimal,
  kString,
  kBinary,
  kDateTime,
  kList,
  kDocument,
};

std::string_view ToString(ValueKind kind);

/// A typed domain value. Unset models both "null" and "never assigned", the
/// mapper decides whether that becomes a Null node or an omitted attribute.
class FieldValue {
public:
  using List = std::vector<FieldValue>;
  using DocumentPtr = std::shared_ptr<const Document>;

  FieldValue() = default;

  FieldValue(bool b) : storage_(b) { // NOLINT (google-explicit-constructor)
  }

  template <typename I>
    requires(std::is_integral_v<I> && !std::is_same_v<I, bool>)
  FieldValue(I i) : storage_(static_cast<int64_t>(i)) { // NOLINT (google-explicit-constructor)
  }

  FieldValue(double d) : storage_(d) { // NOLINT (google-explicit-constructor)
  }

  FieldValue(std::string s) : storage_(std::move(s)) { // NOLINT (google-explicit-constructor)
  }

  FieldValue(std::string_view s) // NOLINT (google-explicit-constructor)
      : storage_(std::string(s)) {
  }

  FieldValue(const char* s) : storage_(std::string(s)) { // NOLINT (google-explicit-constructor)
  }

  FieldValue(Binary b) : storage_(std::move(b)) { // NOLINT (google-explicit-constructor)
  }

  FieldValue(DateTime dt) : storage_(dt) { // NOLINT (google-explicit-constructor)
  }

  FieldValue(List l) : storage_(std::move(l)) { // NOLINT (google-explicit-constructor)
  }

  FieldValue(DocumentPtr doc) : storage_(std::move(doc)) { // NOLINT (google-explicit-constructor)
  }

  ValueKind kind() const {
    return static_cast<ValueKind>(storage_.index());
  }

  bool IsSet() const {
    return kind() != ValueKind::kUnset;
  }

  const bool* AsBool() const {
    return std::get_if<bool>(&storage_);
  }

  const int64_t* AsInteger() const {
    return std::get_if<int64_t>(&storage_);
  }

  const double* AsDecimal() const {
    return std::get_if<double>(&storage_);
  }

  const std::string* AsString() const {
    return std::get_if<std::string>(&storage_);
  }

  const Binary* AsBinary() const {
    return std::get_if<Binary>(&storage_);
  }

  const DateTime* AsDateTime() const {
    return std::get_if<DateTime>(&storage_);
  }

  const List* AsList() const {
    return std::get_if<List>(&storage_);
  }

  const Document* AsDocument() const {
    auto* ptr = std::get_if<DocumentPtr>(&storage_);
    return ptr != nullptr ? ptr->get() : nullptr;
  }

  /// Debug rendering used in log lines and error context.
  std::string ToString() const;

  /// Nested documents compare by content.
  bool operator==(const FieldValue& other) const;

  bool operator!=(const FieldValue& other) const {
    return !(*this == other);
  }

private:
  // Alternative order must follow ValueKind.
  using Storage = std::variant<std::monostate, bool, int64_t, double, std::string, Binary,
                               DateTime, List, DocumentPtr>;

  Storage storage_;
};

} // namespace dynamap
