#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace dynamap {

using Binary = std::vector<uint8_t>;

/// Wire-level tag of an attribute value, one per variant of the store's
/// attribute value union.
enum class AttributeType : uint8_t {
  kString = 0,
  kNumber,
  kBinary,
  kStringSet,
  kNumberSet,
  kBinarySet,
  kList,
  kMap,
  kBool,
  kNull,
};

std::string_view ToString(AttributeType type);

class AttributeValue;

using AttributeList = std::vector<AttributeValue>;
using AttributeMap = std::map<std::string, AttributeValue, std::less<>>;

/// A sparse record as stored by the document store: attribute name to value.
using RawRecord = AttributeMap;

/// Tagged attribute value. Exactly one variant is populated, numbers are kept
/// in their decimal text form as on the wire.
class AttributeValue {
private:
  static constexpr size_t Index(AttributeType type) {
    return static_cast<size_t>(type);
  }

public:
  /// Default constructed value is a Null node.
  AttributeValue() : storage_(std::in_place_index<Index(AttributeType::kNull)>) {
  }

  static AttributeValue String(std::string s) {
    return AttributeValue(std::in_place_index<Index(AttributeType::kString)>, std::move(s));
  }

  static AttributeValue Number(std::string text) {
    return AttributeValue(std::in_place_index<Index(AttributeType::kNumber)>, std::move(text));
  }

  static AttributeValue Bytes(Binary b) {
    return AttributeValue(std::in_place_index<Index(AttributeType::kBinary)>, std::move(b));
  }

  static AttributeValue StringSet(std::vector<std::string> ss) {
    return AttributeValue(std::in_place_index<Index(AttributeType::kStringSet)>, std::move(ss));
  }

  static AttributeValue NumberSet(std::vector<std::string> ns) {
    return AttributeValue(std::in_place_index<Index(AttributeType::kNumberSet)>, std::move(ns));
  }

  static AttributeValue BinarySet(std::vector<Binary> bs) {
    return AttributeValue(std::in_place_index<Index(AttributeType::kBinarySet)>, std::move(bs));
  }

  static AttributeValue List(AttributeList l) {
    return AttributeValue(std::in_place_index<Index(AttributeType::kList)>, std::move(l));
  }

  static AttributeValue Map(AttributeMap m) {
    return AttributeValue(std::in_place_index<Index(AttributeType::kMap)>, std::move(m));
  }

  static AttributeValue Bool(bool b) {
    return AttributeValue(std::in_place_index<Index(AttributeType::kBool)>, b);
  }

  static AttributeValue Null() {
    return AttributeValue();
  }

  AttributeType type() const {
    return static_cast<AttributeType>(storage_.index());
  }

  bool IsNull() const {
    return type() == AttributeType::kNull;
  }

  //----------------------------------------------------------------------------
  // Accessors, return nullptr when the value holds another variant
  //----------------------------------------------------------------------------

  const std::string* AsString() const {
    return std::get_if<Index(AttributeType::kString)>(&storage_);
  }

  const std::string* AsNumber() const {
    return std::get_if<Index(AttributeType::kNumber)>(&storage_);
  }

  const Binary* AsBinary() const {
    return std::get_if<Index(AttributeType::kBinary)>(&storage_);
  }

  const std::vector<std::string>* AsStringSet() const {
    return std::get_if<Index(AttributeType::kStringSet)>(&storage_);
  }

  const std::vector<std::string>* AsNumberSet() const {
    return std::get_if<Index(AttributeType::kNumberSet)>(&storage_);
  }

  const std::vector<Binary>* AsBinarySet() const {
    return std::get_if<Index(AttributeType::kBinarySet)>(&storage_);
  }

  const AttributeList* AsList() const {
    return std::get_if<Index(AttributeType::kList)>(&storage_);
  }

  const AttributeMap* AsMap() const {
    return std::get_if<Index(AttributeType::kMap)>(&storage_);
  }

  const bool* AsBool() const {
    return std::get_if<Index(AttributeType::kBool)>(&storage_);
  }

  /// Key text of a scalar key attribute (S, N, or hex of B). Empty for any
  /// other variant.
  std::string KeyText() const;

  /// Renders the value in the store's JSON notation, e.g. {"S":"abc"}.
  std::string ToString() const;

  bool operator==(const AttributeValue& other) const {
    return storage_ == other.storage_;
  }

  bool operator!=(const AttributeValue& other) const {
    return !(*this == other);
  }

private:
  using Storage = std::variant<std::string,              // S
                               std::string,              // N
                               Binary,                   // B
                               std::vector<std::string>, // SS
                               std::vector<std::string>, // NS
                               std::vector<Binary>,      // BS
                               AttributeList,            // L
                               AttributeMap,             // M
                               bool,                     // BOOL
                               std::monostate>;          // NULL

  template <size_t I, typename... Args>
  explicit AttributeValue(std::in_place_index_t<I> idx, Args&&... args)
      : storage_(idx, std::forward<Args>(args)...) {
  }

  Storage storage_;
};

/// Renders a raw record in the store's JSON notation. Attributes listed in
/// redacted_names are printed as "[REDACTED]".
std::string ToString(const RawRecord& record, const std::vector<std::string>& redacted_names = {});

} // namespace dynamap
