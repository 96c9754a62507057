#pragma once

#include "dynamap/key/key_template.hpp"
#include "dynamap/mapper_option.hpp"
#include "dynamap/value/date_time.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace dynamap {

class SchemaModel;

/// Scalar types supported by entity fields.
enum class ScalarType : uint8_t {
  kString = 0,
  kNumber,
  kBoolean,
  kBinary,
  kDateTime,
  kEnum,
  kNested,
};

/// Domain representation of a kNumber field.
enum class NumberKind : uint8_t {
  kInteger = 0,
  kDecimal,
};

enum class KeyRole : uint8_t {
  kNone = 0,
  kPartition,
  kSort,
  kGsiPartition,
  kGsiSort,
};

/// Wire shape of a collection field.
enum class CollectionKind : uint8_t {
  kNone = 0,
  /// SS, NS or BS depending on the element type.
  kSet,
  /// L with one node per element.
  kList,
};

inline std::string_view ToString(ScalarType type) {
  switch (type) {
  case ScalarType::kString:
    return "STRING";
  case ScalarType::kNumber:
    return "NUMBER";
  case ScalarType::kBoolean:
    return "BOOLEAN";
  case ScalarType::kBinary:
    return "BINARY";
  case ScalarType::kDateTime:
    return "DATETIME";
  case ScalarType::kEnum:
    return "ENUM";
  case ScalarType::kNested:
    return "NESTED";
  }
  return "UNKNOWN";
}

inline std::string_view ToString(KeyRole role) {
  switch (role) {
  case KeyRole::kNone:
    return "NONE";
  case KeyRole::kPartition:
    return "PARTITION";
  case KeyRole::kSort:
    return "SORT";
  case KeyRole::kGsiPartition:
    return "GSI_PARTITION";
  case KeyRole::kGsiSort:
    return "GSI_SORT";
  }
  return "UNKNOWN";
}

/// Rule of a derived (computed) field: its value is rendered from source
/// fields before write.
struct DerivedKeyRule {
  /// Source field names, in declared order.
  std::vector<std::string> sources_;

  /// Optional positional template like "TENANT#{0}#CUSTOMER#{1:D4}". When
  /// empty the sources are joined with separator_.
  std::string template_;

  std::string separator_ = "#";

  /// Indexes of sources_ into SchemaModel::fields(), resolved at build time.
  std::vector<uint32_t> source_indexes_;

  /// template_ or the separator join, compiled at build time.
  KeyTemplate compiled_;
};

/// Rule of an extracted field: its value is parsed out of a stored source
/// field after read.
struct ExtractedKeyRule {
  std::string source_;
  uint32_t index_ = 0;
  std::string separator_ = "#";
  ExtractionPolicy policy_ = ExtractionPolicy::kDefault;

  /// Index of source_ into SchemaModel::fields(), resolved at build time.
  uint32_t source_index_ = 0;
};

/// Definition of a single field of an entity shape.
struct FieldDescriptor {
  /// Name of the field on the domain object.
  std::string source_name_;

  /// Attribute name in the raw record, defaults to source_name_.
  std::string stored_name_;

  ScalarType scalar_type_ = ScalarType::kString;
  NumberKind number_kind_ = NumberKind::kInteger;
  CollectionKind collection_ = CollectionKind::kNone;

  /// Nullable fields may be absent from a record; non-nullable fields are
  /// required when constructing an entity.
  bool nullable_ = true;

  /// Write a Null node for an unset value instead of omitting the attribute.
  bool store_null_ = false;

  KeyRole key_role_ = KeyRole::kNone;

  /// Index name for kGsiPartition and kGsiSort.
  std::string index_name_;

  /// Encode-side format: date patterns for datetimes, F<n>/D<n>/E<n> for
  /// numbers.
  std::string format_;

  TimezonePolicy timezone_;

  /// Redacted in log lines and error context.
  bool sensitive_ = false;

  /// Routed through the FieldEncryptor and stored as a Binary node.
  bool encrypted_ = false;

  /// Shape of a kNested field.
  std::shared_ptr<const SchemaModel> nested_;

  /// Used by definition loaders to resolve nested_ by entity id.
  std::string nested_entity_id_;

  std::optional<DerivedKeyRule> derived_;
  std::optional<ExtractedKeyRule> extracted_;

  bool IsCollection() const {
    return collection_ != CollectionKind::kNone;
  }

  bool IsDerived() const {
    return derived_.has_value();
  }

  bool IsExtracted() const {
    return extracted_.has_value();
  }

  /// Extracted fields live only on the domain object.
  bool IsStored() const {
    return !IsExtracted();
  }

  bool IsPrimaryKey() const {
    return key_role_ == KeyRole::kPartition || key_role_ == KeyRole::kSort;
  }

  /// Stored and required to construct the entity.
  bool IsRequired() const {
    return IsStored() && (!nullable_ || IsPrimaryKey());
  }
};

/// Fluent helpers to declare fields in code.
class FieldBuilder {
public:
  explicit FieldBuilder(std::string source_name, ScalarType type = ScalarType::kString) {
    desc_.source_name_ = std::move(source_name);
    desc_.scalar_type_ = type;
  }

  FieldBuilder& StoredAs(std::string stored_name) {
    desc_.stored_name_ = std::move(stored_name);
    return *this;
  }

  FieldBuilder& Decimal() {
    desc_.number_kind_ = NumberKind::kDecimal;
    return *this;
  }

  FieldBuilder& Collection(CollectionKind kind = CollectionKind::kSet) {
    desc_.collection_ = kind;
    return *this;
  }

  FieldBuilder& Required() {
    desc_.nullable_ = false;
    return *this;
  }

  FieldBuilder& StoreNull() {
    desc_.store_null_ = true;
    return *this;
  }

  FieldBuilder& PartitionKey() {
    desc_.key_role_ = KeyRole::kPartition;
    desc_.nullable_ = false;
    return *this;
  }

  FieldBuilder& SortKey() {
    desc_.key_role_ = KeyRole::kSort;
    desc_.nullable_ = false;
    return *this;
  }

  FieldBuilder& GsiPartitionKey(std::string index_name) {
    desc_.key_role_ = KeyRole::kGsiPartition;
    desc_.index_name_ = std::move(index_name);
    return *this;
  }

  FieldBuilder& GsiSortKey(std::string index_name) {
    desc_.key_role_ = KeyRole::kGsiSort;
    desc_.index_name_ = std::move(index_name);
    return *this;
  }

  FieldBuilder& Format(std::string format) {
    desc_.format_ = std::move(format);
    return *this;
  }

  FieldBuilder& Timezone(TimezonePolicy policy) {
    desc_.timezone_ = policy;
    return *this;
  }

  FieldBuilder& Sensitive() {
    desc_.sensitive_ = true;
    return *this;
  }

  FieldBuilder& Encrypted() {
    desc_.encrypted_ = true;
    return *this;
  }

  FieldBuilder& Nested(std::shared_ptr<const SchemaModel> nested) {
    desc_.nested_ = std::move(nested);
    return *this;
  }

  FieldBuilder& DerivedFrom(std::vector<std::string> sources, std::string separator = "#") {
    DerivedKeyRule rule;
    rule.sources_ = std::move(sources);
    rule.separator_ = std::move(separator);
    desc_.derived_ = std::move(rule);
    return *this;
  }

  FieldBuilder& DerivedFromTemplate(std::vector<std::string> sources, std::string key_template) {
    DerivedKeyRule rule;
    rule.sources_ = std::move(sources);
    rule.template_ = std::move(key_template);
    desc_.derived_ = std::move(rule);
    return *this;
  }

  FieldBuilder& ExtractedFrom(std::string source, uint32_t index, std::string separator = "#",
                              ExtractionPolicy policy = ExtractionPolicy::kDefault) {
    ExtractedKeyRule rule;
    rule.source_ = std::move(source);
    rule.index_ = index;
    rule.separator_ = std::move(separator);
    rule.policy_ = policy;
    desc_.extracted_ = std::move(rule);
    return *this;
  }

  FieldDescriptor Build() const {
    auto desc = desc_;
    if (desc.stored_name_.empty()) {
      desc.stored_name_ = desc.source_name_;
    }
    return desc;
  }

  operator FieldDescriptor() const { // NOLINT (google-explicit-constructor)
    return Build();
  }

private:
  FieldDescriptor desc_;
};

} // namespace dynamap
