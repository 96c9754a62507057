#include "dynamap/schema/schema_builder.hpp"

#include "dynamap/base/log.hpp"
#include "dynamap/key/key_template.hpp"
#include "dynamap/value/value_codec.hpp"

#include <algorithm>
#include <format>
#include <map>
#include <unordered_set>

namespace dynamap {

namespace {

enum class VisitMark : uint8_t {
  kNew = 0,
  kActive,
  kDone,
};

std::string PathOf(const EntityDefinition& def, std::string_view field = {}) {
  std::string entity = def.entity_id_.empty() ? std::string("<unnamed>") : def.entity_id_;
  return field.empty() ? entity : std::format("{}.{}", entity, field);
}

const std::string& StoredNameOf(const FieldDescriptor& field) {
  return field.stored_name_.empty() ? field.source_name_ : field.stored_name_;
}

/// Key attributes of the store are S, N or B; datetimes and enums are stored
/// as S.
bool IsKeyType(ScalarType type) {
  return type == ScalarType::kString || type == ScalarType::kNumber ||
         type == ScalarType::kBinary || type == ScalarType::kDateTime ||
         type == ScalarType::kEnum;
}

std::unordered_map<std::string, uint32_t> IndexNames(const EntityDefinition& def) {
  std::unordered_map<std::string, uint32_t> names;
  for (uint32_t i = 0; i < def.fields_.size(); ++i) {
    names.emplace(def.fields_[i].source_name_, i);
  }
  return names;
}

void VisitDerived(uint32_t idx, const EntityDefinition& def,
                  const std::unordered_map<std::string, uint32_t>& names,
                  std::vector<VisitMark>& marks, std::vector<uint32_t>& path, Diagnostics& out) {
  marks[idx] = VisitMark::kActive;
  path.push_back(idx);

  const auto& field = def.fields_[idx];
  if (field.derived_) {
    for (const auto& source : field.derived_->sources_) {
      auto it = names.find(source);
      if (it == names.end()) {
        continue;
      }
      auto next = it->second;
      if (marks[next] == VisitMark::kActive) {
        auto start = std::find(path.begin(), path.end(), next);
        std::string cycle;
        for (auto pos = start; pos != path.end(); ++pos) {
          cycle += def.fields_[*pos].source_name_ + " -> ";
        }
        cycle += def.fields_[next].source_name_;
        out.push_back(MakeDiagnostic(DiagnosticCode::kCircularKeyDependency,
                                     PathOf(def, field.source_name_),
                                     std::format("derived key cycle {}", cycle)));
      } else if (marks[next] == VisitMark::kNew) {
        VisitDerived(next, def, names, marks, path, out);
      }
    }
  }

  path.pop_back();
  marks[idx] = VisitMark::kDone;
}

/// Post-order over derived edges: sources come before the fields derived
/// from them. Requires an acyclic graph.
void OrderDerived(uint32_t idx, const std::vector<FieldDescriptor>& fields,
                  std::vector<bool>& visited, std::vector<uint32_t>& order) {
  visited[idx] = true;
  const auto& field = fields[idx];
  if (!field.derived_) {
    return;
  }
  for (auto source : field.derived_->source_indexes_) {
    if (!visited[source]) {
      OrderDerived(source, fields, visited, order);
    }
  }
  order.push_back(idx);
}

bool HasSortKey(const EntityDefinition& def) {
  return std::any_of(def.fields_.begin(), def.fields_.end(),
                     [](const FieldDescriptor& f) { return f.key_role_ == KeyRole::kSort; });
}

KeyPattern AttributeMatcherOf(const DiscriminatorRule& rule) {
  if (!rule.attribute_value_.empty()) {
    return KeyPattern::Exact(rule.attribute_value_);
  }
  return KeyPattern::Wildcard(rule.attribute_pattern_);
}

/// Whether some discriminator rule can tell records of the two shapes apart.
bool Distinguishable(const SchemaModel& a, const SchemaModel& b) {
  const auto& da = a.discriminator();
  const auto& db = b.discriminator();
  bool a_any = da.HasAttributeRule() || da.HasSortKeyRule();
  bool b_any = db.HasAttributeRule() || db.HasSortKeyRule();
  if (!a_any && !b_any) {
    return false;
  }
  if (a_any != b_any) {
    return true;
  }

  bool shared_attr = da.HasAttributeRule() && db.HasAttributeRule();
  bool shared_sk = da.HasSortKeyRule() && db.HasSortKeyRule();
  if (shared_attr && (da.attribute_name_ != db.attribute_name_ ||
                      !da.attribute_matcher_.Overlaps(db.attribute_matcher_))) {
    return true;
  }
  if (shared_sk && !da.sort_key_matcher_.Overlaps(db.sort_key_matcher_)) {
    return true;
  }
  return !shared_attr && !shared_sk;
}

} // namespace

//------------------------------------------------------------------------------
// Validation passes
//------------------------------------------------------------------------------

void SchemaBuilder::CheckStructure(const EntityDefinition& def, Diagnostics& out) const {
  auto entity_path = PathOf(def);
  if (def.entity_id_.empty()) {
    out.push_back(MakeDiagnostic(DiagnosticCode::kInvalidDefinition, entity_path,
                                 "entity id must not be empty"));
  }
  if (!def.nested_ && def.table_name_.empty()) {
    out.push_back(MakeDiagnostic(DiagnosticCode::kInvalidDefinition, entity_path,
                                 "table name must not be empty"));
  }
  if (def.fields_.empty()) {
    out.push_back(MakeDiagnostic(DiagnosticCode::kInvalidDefinition, entity_path,
                                 "entity must declare at least one field"));
  }

  struct IndexKeys {
    uint32_t partitions_ = 0;
    uint32_t sorts_ = 0;
  };

  std::unordered_set<std::string> names;
  std::unordered_set<std::string> stored_names;
  std::map<std::string, IndexKeys> indexes;
  uint32_t partitions = 0;
  uint32_t sorts = 0;

  for (const auto& field : def.fields_) {
    auto path = PathOf(def, field.source_name_);
    auto report = [&](DiagnosticCode code, std::string message) {
      out.push_back(MakeDiagnostic(code, path, std::move(message)));
    };

    if (field.source_name_.empty()) {
      report(DiagnosticCode::kInvalidDefinition, "field name must not be empty");
      continue;
    }
    if (!names.insert(field.source_name_).second) {
      report(DiagnosticCode::kDuplicateFieldName,
             std::format("field \"{}\" is declared more than once", field.source_name_));
    }
    if (field.IsStored() && !stored_names.insert(StoredNameOf(field)).second) {
      report(DiagnosticCode::kDuplicateStoredName,
             std::format("attribute \"{}\" is stored by more than one field", StoredNameOf(field)));
    }

    switch (field.key_role_) {
    case KeyRole::kPartition:
      ++partitions;
      break;
    case KeyRole::kSort:
      ++sorts;
      break;
    case KeyRole::kGsiPartition:
    case KeyRole::kGsiSort:
      if (field.index_name_.empty()) {
        report(DiagnosticCode::kInvalidGsiConfiguration,
               std::format("{} key needs an index name", ToString(field.key_role_)));
      } else if (field.key_role_ == KeyRole::kGsiPartition) {
        ++indexes[field.index_name_].partitions_;
      } else {
        ++indexes[field.index_name_].sorts_;
      }
      break;
    case KeyRole::kNone:
      break;
    }

    if (field.key_role_ != KeyRole::kNone) {
      if (def.nested_) {
        report(DiagnosticCode::kInvalidNestedShape, "fields of nested shapes cannot be keys");
      }
      if (field.IsCollection()) {
        report(DiagnosticCode::kCollectionFieldCannotBeKey,
               std::format("collection field cannot be a {} key", ToString(field.key_role_)));
      } else if (!IsKeyType(field.scalar_type_)) {
        report(DiagnosticCode::kInvalidDefinition,
               std::format("{} fields cannot be keys, keys are strings, numbers or binaries",
                           ToString(field.scalar_type_)));
      }
      if (field.IsExtracted()) {
        report(DiagnosticCode::kConflictingFieldRoles,
               "extracted fields are not stored and cannot be keys");
      }
      if (field.encrypted_) {
        report(DiagnosticCode::kConflictingFieldRoles, "key fields cannot be encrypted");
      }
    }

    if (field.IsDerived() && field.IsExtracted()) {
      report(DiagnosticCode::kConflictingFieldRoles, "a field is either derived or extracted");
    }
    if (field.IsDerived() && field.IsCollection()) {
      report(DiagnosticCode::kConflictingFieldRoles, "derived fields cannot be collections");
    }
    if (field.IsExtracted() &&
        (field.store_null_ || field.encrypted_ || field.IsCollection() ||
         field.scalar_type_ == ScalarType::kNested)) {
      report(DiagnosticCode::kConflictingFieldRoles,
             "extracted fields are plain scalars that are never stored");
    }
    if (field.encrypted_ && (field.IsCollection() || field.scalar_type_ == ScalarType::kNested)) {
      report(DiagnosticCode::kConflictingFieldRoles, "only scalar fields can be encrypted");
    }
    if (field.collection_ == CollectionKind::kSet &&
        (field.scalar_type_ == ScalarType::kBoolean || field.scalar_type_ == ScalarType::kNested)) {
      report(DiagnosticCode::kInvalidDefinition,
             std::format("{} values cannot form a set, declare a list instead",
                         ToString(field.scalar_type_)));
    }

    if (field.scalar_type_ == ScalarType::kNested && field.nested_ == nullptr) {
      report(DiagnosticCode::kInvalidNestedShape,
             field.nested_entity_id_.empty()
                 ? std::string("nested field declares no shape")
                 : std::format("nested shape \"{}\" is not built", field.nested_entity_id_));
    } else if (field.scalar_type_ != ScalarType::kNested && field.nested_ != nullptr) {
      report(DiagnosticCode::kInvalidNestedShape,
             std::format("{} field cannot carry a nested shape", ToString(field.scalar_type_)));
    } else if (field.nested_ != nullptr && !field.nested_->nested()) {
      report(DiagnosticCode::kInvalidNestedShape,
             std::format("shape \"{}\" is not declared nested", field.nested_->entity_id()));
    }

    if (!field.format_.empty()) {
      if (auto res = ValueCodec::ValidateFormat(field, field.format_); !res) {
        report(DiagnosticCode::kInvalidFieldFormat, res.error().Message());
      }
    }
  }

  if (!def.nested_ && partitions == 0) {
    out.push_back(MakeDiagnostic(DiagnosticCode::kMissingPartitionKey, entity_path,
                                 "entity declares no partition key field"));
  }
  if (partitions > 1) {
    out.push_back(
        MakeDiagnostic(DiagnosticCode::kMultiplePartitionKeys, entity_path,
                       std::format("entity declares {} partition key fields", partitions)));
  }
  if (sorts > 1) {
    out.push_back(MakeDiagnostic(DiagnosticCode::kMultipleSortKeys, entity_path,
                                 std::format("entity declares {} sort key fields", sorts)));
  }
  for (const auto& [index, keys] : indexes) {
    if (keys.partitions_ != 1) {
      out.push_back(MakeDiagnostic(
          DiagnosticCode::kInvalidGsiConfiguration, entity_path,
          std::format("index \"{}\" needs exactly one partition key field, found {}", index,
                      keys.partitions_)));
    }
    if (keys.sorts_ > 1) {
      out.push_back(MakeDiagnostic(
          DiagnosticCode::kInvalidGsiConfiguration, entity_path,
          std::format("index \"{}\" declares {} sort key fields", index, keys.sorts_)));
    }
  }
}

void SchemaBuilder::CheckKeyGraph(const EntityDefinition& def, const NameIndex& names,
                                  Diagnostics& out) const {
  std::vector<VisitMark> marks(def.fields_.size(), VisitMark::kNew);
  std::vector<uint32_t> path;
  for (uint32_t i = 0; i < def.fields_.size(); ++i) {
    if (marks[i] == VisitMark::kNew && def.fields_[i].IsDerived()) {
      VisitDerived(i, def, names, marks, path, out);
    }
  }
}

void SchemaBuilder::CheckDerivedAndExtracted(const EntityDefinition& def, const NameIndex& names,
                                             Diagnostics& out) const {
  for (const auto& field : def.fields_) {
    auto path = PathOf(def, field.source_name_);
    auto report = [&](DiagnosticCode code, std::string message) {
      out.push_back(MakeDiagnostic(code, path, std::move(message)));
    };

    if (field.derived_) {
      const auto& rule = *field.derived_;
      if (rule.sources_.empty()) {
        report(DiagnosticCode::kInvalidDerivedKeySource, "derived field declares no sources");
      }
      if (field.scalar_type_ != ScalarType::kString) {
        report(DiagnosticCode::kInvalidKeyFormat,
               std::format("derived fields hold rendered key text and must be STRING, not {}",
                           ToString(field.scalar_type_)));
      }

      std::vector<const FieldDescriptor*> sources;
      for (const auto& source : rule.sources_) {
        auto it = names.find(source);
        if (it == names.end()) {
          report(DiagnosticCode::kInvalidDerivedKeySource,
                 std::format("source field \"{}\" does not exist", source));
          sources.push_back(nullptr);
          continue;
        }
        const auto& src = def.fields_[it->second];
        if (src.IsCollection() || src.scalar_type_ == ScalarType::kNested) {
          report(DiagnosticCode::kInvalidDerivedKeySource,
                 std::format("source field \"{}\" must be a scalar", source));
        }
        sources.push_back(&src);
      }

      if (!rule.template_.empty()) {
        auto parsed = KeyTemplate::Parse(rule.template_, rule.sources_.size());
        if (!parsed) {
          report(DiagnosticCode::kInvalidKeyFormat, parsed.error().Message());
        } else {
          for (const auto& segment : parsed.value().segments()) {
            if (segment.source_ < 0 || segment.format_.empty() ||
                sources[segment.source_] == nullptr) {
              continue;
            }
            const auto& src = *sources[segment.source_];
            if (auto res = ValueCodec::ValidateFormat(src, segment.format_); !res) {
              report(DiagnosticCode::kInvalidKeyFormat,
                     std::format("placeholder {{{}:{}}}: {}", segment.source_, segment.format_,
                                 res.error().Message()));
            }
          }
        }
      } else if (rule.separator_.empty() && rule.sources_.size() > 1) {
        report(DiagnosticCode::kInvalidKeyFormat,
               "separator must not be empty when joining several sources");
      }
    }

    if (field.extracted_) {
      const auto& rule = *field.extracted_;
      auto it = names.find(rule.source_);
      if (it == names.end()) {
        report(DiagnosticCode::kInvalidExtractedKeySource,
               std::format("source field \"{}\" does not exist", rule.source_));
      } else {
        const auto& src = def.fields_[it->second];
        if (&src == &field || src.IsExtracted()) {
          report(DiagnosticCode::kInvalidExtractedKeySource,
                 std::format("source field \"{}\" must be a stored field", rule.source_));
        } else if (src.scalar_type_ != ScalarType::kString || src.IsCollection()) {
          report(DiagnosticCode::kInvalidExtractedKeySource,
                 std::format("source field \"{}\" must be a STRING scalar", rule.source_));
        }
      }
      if (rule.separator_.empty()) {
        report(DiagnosticCode::kInvalidKeyFormat, "extraction separator must not be empty");
      }
    }
  }
}

void SchemaBuilder::CheckRelationships(const EntityDefinition& def, Diagnostics& out) const {
  if (def.relationships_.empty()) {
    return;
  }
  auto entity_path = PathOf(def);
  if (def.nested_) {
    out.push_back(MakeDiagnostic(DiagnosticCode::kInvalidNestedShape, entity_path,
                                 "nested shapes cannot declare relationships"));
  }
  if (!HasSortKey(def)) {
    out.push_back(MakeDiagnostic(DiagnosticCode::kRelationshipsRequireSortKey, entity_path,
                                 "without a sort key every record of a partition is the primary"));
  }

  std::unordered_set<std::string> field_names;
  for (const auto& field : def.fields_) {
    field_names.insert(field.source_name_);
  }

  std::unordered_set<std::string> seen;
  std::vector<std::pair<std::string, KeyPattern>> patterns;
  auto own_pattern = def.discriminator_.HasSortKeyRule()
                         ? KeyPattern::Wildcard(def.discriminator_.sort_key_pattern_)
                         : KeyPattern();

  for (const auto& rel : def.relationships_) {
    auto path = PathOf(def, rel.target_field_name_);
    auto report = [&](DiagnosticCode code, std::string message) {
      out.push_back(MakeDiagnostic(code, path, std::move(message)));
    };

    if (rel.target_field_name_.empty()) {
      report(DiagnosticCode::kInvalidRelationshipTarget,
             "relationship field name must not be empty");
    } else if (field_names.contains(rel.target_field_name_)) {
      report(DiagnosticCode::kInvalidRelationshipTarget,
             "relationship field collides with a declared field");
    } else if (!seen.insert(rel.target_field_name_).second) {
      report(DiagnosticCode::kInvalidRelationshipTarget, "relationship is declared more than once");
    }

    if (rel.target_ == nullptr) {
      report(DiagnosticCode::kInvalidRelationshipTarget,
             rel.target_entity_id_.empty()
                 ? std::string("relationship declares no target shape")
                 : std::format("target shape \"{}\" is not built", rel.target_entity_id_));
    } else if (rel.target_->nested()) {
      report(DiagnosticCode::kInvalidRelationshipTarget,
             std::format("nested shape \"{}\" cannot be a relationship target",
                         rel.target_->entity_id()));
    }

    if (rel.sort_key_pattern_.empty()) {
      report(DiagnosticCode::kInvalidRelationshipTarget, "relationship needs a sort key pattern");
      continue;
    }

    auto pattern = KeyPattern::Segment(rel.sort_key_pattern_);
    for (const auto& [other_name, other] : patterns) {
      if (pattern.Overlaps(other)) {
        report(DiagnosticCode::kConflictingRelationshipPatterns,
               std::format("pattern \"{}\" may match records of \"{}\" (\"{}\"), the first "
                           "declared relationship takes them",
                           rel.sort_key_pattern_, other_name, other.source()));
      }
    }
    if (pattern.Overlaps(own_pattern)) {
      report(DiagnosticCode::kConflictingRelationshipPatterns,
             std::format("pattern \"{}\" may match the primary record pattern \"{}\"",
                         rel.sort_key_pattern_, own_pattern.source()));
    }
    patterns.emplace_back(rel.target_field_name_, std::move(pattern));
  }
}

void SchemaBuilder::CheckDiscriminator(const EntityDefinition& def, const NameIndex& names,
                                       Diagnostics& out) const {
  const auto& rule = def.discriminator_;
  auto entity_path = PathOf(def);
  auto report = [&](DiagnosticCode code, std::string message) {
    out.push_back(MakeDiagnostic(code, entity_path, std::move(message)));
  };

  bool has_any = rule.HasAttributeRule() || rule.HasSortKeyRule();
  if (def.nested_ && has_any) {
    report(DiagnosticCode::kInvalidNestedShape, "nested shapes cannot declare a discriminator");
    return;
  }

  if (!rule.HasAttributeRule() &&
      (!rule.attribute_value_.empty() || !rule.attribute_pattern_.empty())) {
    report(DiagnosticCode::kInvalidDiscriminator,
           "discriminator value is given without an attribute name");
  }
  if (rule.HasAttributeRule()) {
    if (rule.attribute_value_.empty() && rule.attribute_pattern_.empty()) {
      report(DiagnosticCode::kInvalidDiscriminator,
             std::format("discriminator attribute \"{}\" declares neither a value nor a pattern",
                         rule.attribute_name_));
    } else if (!rule.attribute_value_.empty() && !rule.attribute_pattern_.empty()) {
      auto diag = MakeDiagnostic(
          DiagnosticCode::kInvalidDiscriminator, entity_path,
          std::format("discriminator attribute \"{}\" declares both value \"{}\" and pattern "
                      "\"{}\", the value is used",
                      rule.attribute_name_, rule.attribute_value_, rule.attribute_pattern_));
      diag.severity_ = DiagnosticSeverity::kWarning;
      out.push_back(std::move(diag));
    }
    auto it = names.find(rule.attribute_name_);
    if (it != names.end() && def.fields_[it->second].IsExtracted()) {
      report(DiagnosticCode::kInvalidDiscriminator,
             std::format("discriminator attribute \"{}\" is an extracted field and never stored",
                         rule.attribute_name_));
    }
  }
  if (rule.HasSortKeyRule() && !HasSortKey(def)) {
    report(DiagnosticCode::kInvalidDiscriminator,
           "sort key discriminator pattern needs a sort key field");
  }

  if (!def.nested_ && !has_any && !def.relationships_.empty()) {
    report(DiagnosticCode::kAmbiguousDiscriminator,
           "records are recognized by attribute presence only, any record no relationship "
           "claims is taken as a primary record");
  }
}

Result<void> SchemaBuilder::Conclude(const std::string& entity_id, const Diagnostics& found,
                                     Diagnostics* diagnostics) const {
  const Diagnostic* first_error = nullptr;
  size_t errors = 0;
  for (const auto& diag : found) {
    if (diag.IsError()) {
      ++errors;
      if (first_error == nullptr) {
        first_error = &diag;
      }
    } else {
      Log::Warn("Schema {}: {}", entity_id, diag.ToString());
    }
  }
  if (diagnostics != nullptr) {
    diagnostics->insert(diagnostics->end(), found.begin(), found.end());
  }
  if (errors == 0) {
    return {};
  }

  auto err = Error::SchemaBuildFailed(entity_id, errors, first_error->ToString());
  for (const auto& diag : found) {
    if (diag.IsError()) {
      err.WithContext("diagnostic", diag.ToString());
    }
  }
  return err;
}

//------------------------------------------------------------------------------
// Build
//------------------------------------------------------------------------------

Result<SchemaModelPtr> SchemaBuilder::Build(const EntityDefinition& definition,
                                            Diagnostics* diagnostics) const {
  Diagnostics found;
  auto names = IndexNames(definition);
  CheckStructure(definition, found);
  CheckKeyGraph(definition, names, found);
  CheckDerivedAndExtracted(definition, names, found);
  CheckRelationships(definition, found);
  CheckDiscriminator(definition, names, found);
  DYNAMAP_RETURN_IF_ERROR(Conclude(definition.entity_id_, found, diagnostics));

  auto model = std::make_shared<SchemaModel>(SchemaModel::ConstructionKey{});
  model->entity_id_ = definition.entity_id_;
  model->table_name_ = definition.table_name_;
  model->nested_ = definition.nested_;
  model->fields_ = definition.fields_;

  for (uint32_t i = 0; i < model->fields_.size(); ++i) {
    auto& field = model->fields_[i];
    if (field.stored_name_.empty()) {
      field.stored_name_ = field.source_name_;
    }
    if (field.key_role_ == KeyRole::kPartition) {
      model->partition_key_ = static_cast<int32_t>(i);
    } else if (field.key_role_ == KeyRole::kSort) {
      model->sort_key_ = static_cast<int32_t>(i);
    }

    if (field.derived_) {
      auto& rule = *field.derived_;
      rule.source_indexes_.clear();
      for (const auto& source : rule.sources_) {
        rule.source_indexes_.push_back(names.at(source));
      }
      if (rule.template_.empty()) {
        rule.compiled_ = KeyTemplate::Join(rule.sources_.size(), rule.separator_);
      } else {
        DYNAMAP_ASSIGN_OR_RETURN(rule.compiled_,
                                 KeyTemplate::Parse(rule.template_, rule.sources_.size()));
      }
    }
    if (field.extracted_) {
      field.extracted_->source_index_ = names.at(field.extracted_->source_);
      model->extract_order_.push_back(i);
    }
    if (field.sensitive_ && field.IsStored()) {
      model->sensitive_attributes_.push_back(field.stored_name_);
    }
  }

  std::vector<bool> visited(model->fields_.size(), false);
  for (uint32_t i = 0; i < model->fields_.size(); ++i) {
    if (!visited[i] && model->fields_[i].IsDerived()) {
      OrderDerived(i, model->fields_, visited, model->derive_order_);
    }
  }

  model->relationships_ = definition.relationships_;
  for (auto& rel : model->relationships_) {
    rel.matcher_ = KeyPattern::Segment(rel.sort_key_pattern_);
    if (rel.target_entity_id_.empty()) {
      rel.target_entity_id_ = rel.target_->entity_id();
    }
  }

  model->discriminator_ = definition.discriminator_;
  auto& rule = model->discriminator_;
  if (rule.HasAttributeRule()) {
    rule.attribute_matcher_ = AttributeMatcherOf(rule);
  }
  if (rule.HasSortKeyRule()) {
    rule.sort_key_matcher_ = KeyPattern::Wildcard(rule.sort_key_pattern_);
  }

  Log::Debug("Schema built, entity={}, table={}, fields={}, relationships={}",
             model->entity_id_, model->table_name_, model->fields_.size(),
             model->relationships_.size());
  return SchemaModelPtr(std::move(model));
}

Result<std::vector<SchemaModelPtr>> SchemaBuilder::BuildAll(
    std::vector<EntityDefinition> definitions, Diagnostics* diagnostics) const {
  std::unordered_set<std::string> declared;
  for (const auto& def : definitions) {
    if (!declared.insert(def.entity_id_).second) {
      return Error::InvalidArgument(std::format("entity \"{}\" is defined twice", def.entity_id_));
    }
  }

  std::unordered_map<std::string, SchemaModelPtr> built;
  auto pending_reference = [&](const std::string& id) {
    return !id.empty() && declared.contains(id) && !built.contains(id);
  };
  auto ready = [&](const EntityDefinition& def) {
    for (const auto& field : def.fields_) {
      if (field.nested_ == nullptr && pending_reference(field.nested_entity_id_)) {
        return false;
      }
    }
    for (const auto& rel : def.relationships_) {
      if (rel.target_ == nullptr && pending_reference(rel.target_entity_id_)) {
        return false;
      }
    }
    return true;
  };

  std::vector<SchemaModelPtr> models(definitions.size());
  size_t remaining = definitions.size();
  bool progress = true;
  while (remaining > 0 && progress) {
    progress = false;
    for (size_t i = 0; i < definitions.size(); ++i) {
      auto& def = definitions[i];
      if (models[i] != nullptr || !ready(def)) {
        continue;
      }
      for (auto& field : def.fields_) {
        if (field.nested_ == nullptr && built.contains(field.nested_entity_id_)) {
          field.nested_ = built.at(field.nested_entity_id_);
        }
      }
      for (auto& rel : def.relationships_) {
        if (rel.target_ == nullptr && built.contains(rel.target_entity_id_)) {
          rel.target_ = built.at(rel.target_entity_id_);
        }
      }

      DYNAMAP_ASSIGN_OR_RETURN(models[i], Build(def, diagnostics));
      built.emplace(def.entity_id_, models[i]);
      --remaining;
      progress = true;
    }
  }

  if (remaining > 0) {
    Diagnostics found;
    for (size_t i = 0; i < definitions.size(); ++i) {
      if (models[i] == nullptr) {
        found.push_back(MakeDiagnostic(DiagnosticCode::kInvalidRelationshipTarget,
                                       definitions[i].entity_id_,
                                       "shape references form a cycle through entity ids"));
      }
    }
    DYNAMAP_RETURN_IF_ERROR(Conclude(found.front().field_path_, found, diagnostics));
  }

  std::map<std::string, std::vector<SchemaModelPtr>> tables;
  for (const auto& model : models) {
    if (!model->nested()) {
      tables[model->table_name()].push_back(model);
    }
  }
  for (const auto& [table, shapes] : tables) {
    DYNAMAP_RETURN_IF_ERROR(Conclude(table, CheckTableShapes(shapes), diagnostics));
  }
  return models;
}

Diagnostics SchemaBuilder::CheckTableShapes(const std::vector<SchemaModelPtr>& shapes) {
  Diagnostics out;
  for (size_t i = 0; i < shapes.size(); ++i) {
    for (size_t j = i + 1; j < shapes.size(); ++j) {
      const auto& a = *shapes[i];
      const auto& b = *shapes[j];
      if (a.nested() || b.nested() || a.table_name() != b.table_name()) {
        continue;
      }
      if (!Distinguishable(a, b)) {
        out.push_back(MakeDiagnostic(
            DiagnosticCode::kConflictingEntityShapes, b.entity_id(),
            std::format("shapes \"{}\" and \"{}\" in table \"{}\" cannot be told apart by their "
                        "discriminator rules",
                        a.entity_id(), b.entity_id(), a.table_name())));
      }
    }
  }
  return out;
}

} // namespace dynamap
