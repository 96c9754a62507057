#pragma once

#include "dynamap/base/result.hpp"
#include "dynamap/schema/schema_model.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace dynamap {

/// Reads entity definitions from JSON documents.
///
/// The document holds an "entities" array, one object per entity:
///
///   {
///     "entities": [
///       {
///         "entity_id": "Order",
///         "table": "orders",
///         "fields": [
///           {"name": "tenant_id", "type": "string", "required": true},
///           {"name": "pk", "type": "string", "key_role": "partition",
///            "derived": {"sources": ["tenant_id"], "template": "TENANT#{0}"}},
///           {"name": "total", "type": "number", "number_kind": "decimal",
///            "format": "F2"}
///         ],
///         "relationships": [
///           {"field": "lines", "pattern": "LINE#*", "target": "OrderLine"}
///         ],
///         "discriminator": {"attribute": "type", "value": "ORDER"}
///       }
///     ]
///   }
///
/// Nested shapes and relationship targets are referenced by entity id and
/// resolved later by SchemaBuilder::BuildAll(). Only the syntax and the
/// enumerated names are checked here, every other rule is left to the
/// builder.
class DefinitionLoader {
public:
  /// Parses definitions from JSON text. source names the text in errors.
  static Result<std::vector<EntityDefinition>> LoadString(std::string_view json,
                                                          std::string_view source = "<string>");

  /// Reads and parses a JSON file.
  static Result<std::vector<EntityDefinition>> LoadFile(const std::string& path);
};

} // namespace dynamap
