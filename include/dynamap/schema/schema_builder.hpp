#pragma once

#include "dynamap/base/result.hpp"
#include "dynamap/mapper_option.hpp"
#include "dynamap/schema/diagnostic.hpp"
#include "dynamap/schema/schema_model.hpp"

#include <string>
#include <unordered_map>
#include <vector>

namespace dynamap {

/// Validates declarative entity definitions and compiles them into immutable
/// SchemaModels.
///
/// Validation collects every problem instead of stopping at the first one.
/// Checks run in three passes: structural checks (names, key cardinality,
/// roles), graph checks (cycles over derived-key edges), then cross-field
/// checks (derived and extracted sources, templates, relationships,
/// discriminator). A definition with any error-severity diagnostic fails with
/// SchemaBuildFailed, one "diagnostic" context entry per error.
class SchemaBuilder {
public:
  explicit SchemaBuilder(const MapperOption& option = MapperOption{}) : option_(option) {
  }

  /// Builds one shape. Relationship targets and nested shapes must already be
  /// set on the definition. When diagnostics is not null every diagnostic,
  /// warnings included, is appended to it.
  Result<SchemaModelPtr> Build(const EntityDefinition& definition,
                               Diagnostics* diagnostics = nullptr) const;

  /// Builds a set of shapes that reference each other by entity id through
  /// RelationshipDescriptor::target_entity_id_ and
  /// FieldDescriptor::nested_entity_id_. Shapes are built once their
  /// references are built; shapes sharing a table are then checked with
  /// CheckTableShapes(). Returns the models in definition order.
  Result<std::vector<SchemaModelPtr>> BuildAll(std::vector<EntityDefinition> definitions,
                                               Diagnostics* diagnostics = nullptr) const;

  /// Reports ConflictingEntityShapes for every pair of shapes in one table
  /// that no discriminator rule can tell apart.
  static Diagnostics CheckTableShapes(const std::vector<SchemaModelPtr>& shapes);

private:
  using NameIndex = std::unordered_map<std::string, uint32_t>;

  void CheckStructure(const EntityDefinition& def, Diagnostics& out) const;
  void CheckKeyGraph(const EntityDefinition& def, const NameIndex& names, Diagnostics& out) const;
  void CheckDerivedAndExtracted(const EntityDefinition& def, const NameIndex& names,
                                Diagnostics& out) const;
  void CheckRelationships(const EntityDefinition& def, Diagnostics& out) const;
  void CheckDiscriminator(const EntityDefinition& def, const NameIndex& names,
                          Diagnostics& out) const;

  /// Reports the diagnostics and turns error diagnostics into one error.
  Result<void> Conclude(const std::string& entity_id, const Diagnostics& found,
                        Diagnostics* diagnostics) const;

  MapperOption option_;
};

} // namespace dynamap
