#pragma once

#include "dynamap/key/key_pattern.hpp"
#include "dynamap/schema/field_descriptor.hpp"

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace dynamap {

class SchemaModel;
using SchemaModelPtr = std::shared_ptr<const SchemaModel>;

/// Records matching sort_key_pattern_ under the same partition key populate
/// target_field_name_ of the owning entity.
struct RelationshipDescriptor {
  std::string target_field_name_;

  /// "LINE#*" matches by prefix; a pattern without wildcard matches exactly
  /// or as a leading "<pattern>#" segment.
  std::string sort_key_pattern_;

  /// Shape the child records are mapped with.
  SchemaModelPtr target_;

  /// Used by definition loaders to resolve target_ by entity id.
  std::string target_entity_id_;

  bool is_collection_ = true;

  /// Compiled sort_key_pattern_, filled at build time.
  KeyPattern matcher_;
};

/// How a raw record is recognized as an instance of a shape. Rules are tried
/// in order: discriminator attribute, sort-key pattern, attribute presence.
struct DiscriminatorRule {
  /// Name of the discriminator attribute, empty when not used.
  std::string attribute_name_;

  /// Expected exact value of the discriminator attribute.
  std::string attribute_value_;

  /// Pattern for the discriminator attribute ("ORDER*", "*_V2", "*LINE*"),
  /// ignored when attribute_value_ is set.
  std::string attribute_pattern_;

  /// Pattern for the sort-key attribute, empty when not used.
  std::string sort_key_pattern_;

  /// Compiled matchers, filled at build time.
  KeyPattern attribute_matcher_;
  KeyPattern sort_key_matcher_;

  bool HasAttributeRule() const {
    return !attribute_name_.empty();
  }

  bool HasSortKeyRule() const {
    return !sort_key_pattern_.empty();
  }
};

/// Declarative input of one entity shape.
struct EntityDefinition {
  std::string entity_id_;
  std::string table_name_;
  std::vector<FieldDescriptor> fields_;
  std::vector<RelationshipDescriptor> relationships_;
  DiscriminatorRule discriminator_;

  /// Nested shapes are embedded as map attributes and carry no keys.
  bool nested_ = false;
};

/// Immutable, validated descriptor of one entity shape. Created only by
/// SchemaBuilder and shared read-only across all mapping operations.
class SchemaModel {
public:
  const std::string& entity_id() const {
    return entity_id_;
  }

  const std::string& table_name() const {
    return table_name_;
  }

  bool nested() const {
    return nested_;
  }

  const std::vector<FieldDescriptor>& fields() const {
    return fields_;
  }

  const std::vector<RelationshipDescriptor>& relationships() const {
    return relationships_;
  }

  const DiscriminatorRule& discriminator() const {
    return discriminator_;
  }

  /// Partition key field, nullptr only for nested shapes.
  const FieldDescriptor* partition_key() const {
    return partition_key_ < 0 ? nullptr : &fields_[partition_key_];
  }

  const FieldDescriptor* sort_key() const {
    return sort_key_ < 0 ? nullptr : &fields_[sort_key_];
  }

  /// Derived fields in dependency order: every field comes after the derived
  /// fields it is computed from.
  const std::vector<uint32_t>& derive_order() const {
    return derive_order_;
  }

  /// Extracted fields in declared order.
  const std::vector<uint32_t>& extract_order() const {
    return extract_order_;
  }

  /// Stored attribute names of sensitive fields.
  const std::vector<std::string>& sensitive_attributes() const {
    return sensitive_attributes_;
  }

  const FieldDescriptor* FindField(std::string_view source_name) const;

  const FieldDescriptor* FindByStoredName(std::string_view stored_name) const;

  /// Restricts construction to SchemaBuilder while keeping the constructor
  /// reachable for std::make_shared.
  class ConstructionKey {
    friend class SchemaBuilder;
    ConstructionKey() = default;
  };

  explicit SchemaModel(ConstructionKey) {
  }

private:
  friend class SchemaBuilder;

  std::string entity_id_;
  std::string table_name_;
  bool nested_ = false;
  std::vector<FieldDescriptor> fields_;
  std::vector<RelationshipDescriptor> relationships_;
  DiscriminatorRule discriminator_;
  int32_t partition_key_ = -1;
  int32_t sort_key_ = -1;
  std::vector<uint32_t> derive_order_;
  std::vector<uint32_t> extract_order_;
  std::vector<std::string> sensitive_attributes_;
};

} // namespace dynamap
