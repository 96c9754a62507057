#pragma once

#include "dynamap/base/result.hpp"
#include "dynamap/mapper/document.hpp"
#include "dynamap/mapper_option.hpp"
#include "dynamap/schema/schema_model.hpp"

#include <string_view>
#include <vector>

namespace dynamap {

/// Computes derived key fields before a write and extracts key components
/// after a read. Stateless apart from the option, safe to share.
class KeyCompiler {
public:
  explicit KeyCompiler(const MapperOption& option = MapperOption{}) : option_(option) {
  }

  /// Renders a derived field from its sources and assigns it on the document.
  ///
  /// A missing source fails with IncompleteKeyMaterial when the derived field
  /// is required (primary keys always are). For an optional derived field,
  /// e.g. a sparse index key, the field is left unset instead.
  Result<void> ComputeDerived(Document& doc, const SchemaModel& schema,
                              const FieldDescriptor& field) const;

  /// Runs ComputeDerived() for all derived fields in dependency order.
  Result<void> ComputeAllDerived(Document& doc, const SchemaModel& schema) const;

  /// Splits the extracted field's source by the separator and assigns the
  /// component at the declared index. A key with too few components leaves
  /// the field unset and logs a warning under the lenient policy, and fails
  /// with ConversionError under the strict policy.
  Result<void> ExtractComponents(Document& doc, const SchemaModel& schema,
                                 const FieldDescriptor& field) const;

  /// Runs ExtractComponents() for all extracted fields in declared order.
  Result<void> ExtractAllComponents(Document& doc, const SchemaModel& schema) const;

  /// Policy of an extraction rule, kDefault resolved against the option.
  ExtractionPolicy EffectivePolicy(const ExtractedKeyRule& rule) const;

  /// Splits text on every occurrence of separator. Empty components are kept.
  static std::vector<std::string_view> Split(std::string_view text, std::string_view separator);

private:
  MapperOption option_;
};

} // namespace dynamap
