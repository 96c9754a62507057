#include "dynamap/schema/definition_loader.hpp"

#include "dynamap/base/log.hpp"

#define RAPIDJSON_NAMESPACE dynamap::rapidjson
#define RAPIDJSON_NAMESPACE_BEGIN namespace dynamap::rapidjson {
#define RAPIDJSON_NAMESPACE_END }

#include <rapidjson/document.h>
#include <rapidjson/error/en.h>

#undef RAPIDJSON_NAMESPACE_END
#undef RAPIDJSON_NAMESPACE_BEGIN
#undef RAPIDJSON_NAMESPACE

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <format>
#include <initializer_list>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace dynamap {

namespace {

using JsonValue = rapidjson::Value;

template <typename E>
struct NamedValue {
  std::string_view name_;
  E value_;
};

constexpr NamedValue<ScalarType> kScalarTypes[] = {
    {"string", ScalarType::kString},     {"number", ScalarType::kNumber},
    {"boolean", ScalarType::kBoolean},   {"binary", ScalarType::kBinary},
    {"datetime", ScalarType::kDateTime}, {"enum", ScalarType::kEnum},
    {"nested", ScalarType::kNested},
};

constexpr NamedValue<NumberKind> kNumberKinds[] = {
    {"integer", NumberKind::kInteger},
    {"decimal", NumberKind::kDecimal},
};

constexpr NamedValue<CollectionKind> kCollectionKinds[] = {
    {"none", CollectionKind::kNone},
    {"set", CollectionKind::kSet},
    {"list", CollectionKind::kList},
};

constexpr NamedValue<KeyRole> kKeyRoles[] = {
    {"none", KeyRole::kNone},
    {"partition", KeyRole::kPartition},
    {"sort", KeyRole::kSort},
    {"gsiPartition", KeyRole::kGsiPartition},
    {"gsiSort", KeyRole::kGsiSort},
};

constexpr NamedValue<ExtractionPolicy> kPolicies[] = {
    {"default", ExtractionPolicy::kDefault},
    {"lenient", ExtractionPolicy::kLenient},
    {"strict", ExtractionPolicy::kStrict},
};

/// Walks one parsed document. Every error names the JSON path it was found
/// at, e.g. "entities[0].fields[2].type".
class Parser {
public:
  explicit Parser(std::string_view source) : source_(source) {
  }

  Result<std::vector<EntityDefinition>> ParseRoot(const JsonValue& root) {
    if (!root.IsObject()) {
      return Fail("$", "expected an object");
    }
    DYNAMAP_RETURN_IF_ERROR(CheckMembers(root, "$", {"entities"}));
    const auto* entities = Member(root, "entities");
    if (entities == nullptr || !entities->IsArray()) {
      return Fail("entities", "expected an array");
    }

    std::vector<EntityDefinition> definitions;
    definitions.reserve(entities->Size());
    for (rapidjson::SizeType i = 0; i < entities->Size(); ++i) {
      DYNAMAP_ASSIGN_OR_RETURN(auto def,
                               ParseEntity((*entities)[i], std::format("entities[{}]", i)));
      definitions.push_back(std::move(def));
    }
    return definitions;
  }

private:
  Result<EntityDefinition> ParseEntity(const JsonValue& obj, const std::string& path) {
    if (!obj.IsObject()) {
      return Fail(path, "expected an object");
    }
    DYNAMAP_RETURN_IF_ERROR(CheckMembers(
        obj, path, {"entity_id", "table", "nested", "fields", "relationships", "discriminator"}));

    EntityDefinition def;
    DYNAMAP_ASSIGN_OR_RETURN(auto entity_id, RequiredString(obj, "entity_id", path));
    def.entity_id_ = std::move(entity_id);
    DYNAMAP_ASSIGN_OR_RETURN(auto table, OptionalString(obj, "table", path));
    def.table_name_ = table.value_or("");
    DYNAMAP_ASSIGN_OR_RETURN(auto nested, OptionalBool(obj, "nested", path));
    def.nested_ = nested.value_or(false);

    if (const auto* fields = Member(obj, "fields"); fields != nullptr) {
      if (!fields->IsArray()) {
        return Fail(path + ".fields", "expected an array");
      }
      for (rapidjson::SizeType i = 0; i < fields->Size(); ++i) {
        DYNAMAP_ASSIGN_OR_RETURN(auto field,
                                 ParseField((*fields)[i], std::format("{}.fields[{}]", path, i)));
        def.fields_.push_back(std::move(field));
      }
    }

    if (const auto* rels = Member(obj, "relationships"); rels != nullptr) {
      if (!rels->IsArray()) {
        return Fail(path + ".relationships", "expected an array");
      }
      for (rapidjson::SizeType i = 0; i < rels->Size(); ++i) {
        DYNAMAP_ASSIGN_OR_RETURN(
            auto rel, ParseRelationship((*rels)[i], std::format("{}.relationships[{}]", path, i)));
        def.relationships_.push_back(std::move(rel));
      }
    }

    if (const auto* disc = Member(obj, "discriminator"); disc != nullptr) {
      DYNAMAP_ASSIGN_OR_RETURN(def.discriminator_,
                               ParseDiscriminator(*disc, path + ".discriminator"));
    }
    return def;
  }

  Result<FieldDescriptor> ParseField(const JsonValue& obj, const std::string& path) {
    if (!obj.IsObject()) {
      return Fail(path, "expected an object");
    }
    DYNAMAP_RETURN_IF_ERROR(CheckMembers(
        obj, path,
        {"name", "stored_name", "type", "number_kind", "collection", "required", "store_null",
         "key_role", "index", "format", "timezone", "sensitive", "encrypted", "nested", "derived",
         "extracted"}));

    FieldDescriptor field;
    DYNAMAP_ASSIGN_OR_RETURN(auto name, RequiredString(obj, "name", path));
    field.source_name_ = std::move(name);
    DYNAMAP_ASSIGN_OR_RETURN(auto stored_name, OptionalString(obj, "stored_name", path));
    field.stored_name_ = stored_name.value_or(field.source_name_);

    DYNAMAP_ASSIGN_OR_RETURN(field.scalar_type_,
                             OptionalEnum(obj, "type", path, kScalarTypes, ScalarType::kString));
    DYNAMAP_ASSIGN_OR_RETURN(
        field.number_kind_,
        OptionalEnum(obj, "number_kind", path, kNumberKinds, NumberKind::kInteger));
    DYNAMAP_ASSIGN_OR_RETURN(
        field.collection_,
        OptionalEnum(obj, "collection", path, kCollectionKinds, CollectionKind::kNone));
    DYNAMAP_ASSIGN_OR_RETURN(field.key_role_,
                             OptionalEnum(obj, "key_role", path, kKeyRoles, KeyRole::kNone));

    DYNAMAP_ASSIGN_OR_RETURN(auto required, OptionalBool(obj, "required", path));
    field.nullable_ = !required.value_or(field.IsPrimaryKey());
    DYNAMAP_ASSIGN_OR_RETURN(auto store_null, OptionalBool(obj, "store_null", path));
    field.store_null_ = store_null.value_or(false);
    DYNAMAP_ASSIGN_OR_RETURN(auto sensitive, OptionalBool(obj, "sensitive", path));
    field.sensitive_ = sensitive.value_or(false);
    DYNAMAP_ASSIGN_OR_RETURN(auto encrypted, OptionalBool(obj, "encrypted", path));
    field.encrypted_ = encrypted.value_or(false);

    DYNAMAP_ASSIGN_OR_RETURN(auto index, OptionalString(obj, "index", path));
    field.index_name_ = index.value_or("");
    DYNAMAP_ASSIGN_OR_RETURN(auto format, OptionalString(obj, "format", path));
    field.format_ = format.value_or("");
    DYNAMAP_ASSIGN_OR_RETURN(auto nested, OptionalString(obj, "nested", path));
    field.nested_entity_id_ = nested.value_or("");

    DYNAMAP_ASSIGN_OR_RETURN(auto timezone, OptionalString(obj, "timezone", path));
    if (timezone) {
      auto policy = TimezonePolicy::Parse(*timezone);
      if (!policy) {
        return Fail(path + ".timezone", policy.error().Message());
      }
      field.timezone_ = policy.value();
    }

    if (const auto* derived = Member(obj, "derived"); derived != nullptr) {
      DYNAMAP_ASSIGN_OR_RETURN(field.derived_, ParseDerived(*derived, path + ".derived"));
    }
    if (const auto* extracted = Member(obj, "extracted"); extracted != nullptr) {
      DYNAMAP_ASSIGN_OR_RETURN(field.extracted_, ParseExtracted(*extracted, path + ".extracted"));
    }
    return field;
  }

  Result<DerivedKeyRule> ParseDerived(const JsonValue& obj, const std::string& path) {
    if (!obj.IsObject()) {
      return Fail(path, "expected an object");
    }
    DYNAMAP_RETURN_IF_ERROR(CheckMembers(obj, path, {"sources", "template", "separator"}));

    DerivedKeyRule rule;
    const auto* sources = Member(obj, "sources");
    if (sources == nullptr || !sources->IsArray()) {
      return Fail(path + ".sources", "expected an array of field names");
    }
    for (rapidjson::SizeType i = 0; i < sources->Size(); ++i) {
      const auto& source = (*sources)[i];
      if (!source.IsString()) {
        return Fail(std::format("{}.sources[{}]", path, i), "expected a string");
      }
      rule.sources_.emplace_back(source.GetString(), source.GetStringLength());
    }
    DYNAMAP_ASSIGN_OR_RETURN(auto key_template, OptionalString(obj, "template", path));
    rule.template_ = key_template.value_or("");
    DYNAMAP_ASSIGN_OR_RETURN(auto separator, OptionalString(obj, "separator", path));
    rule.separator_ = separator.value_or("#");
    return rule;
  }

  Result<ExtractedKeyRule> ParseExtracted(const JsonValue& obj, const std::string& path) {
    if (!obj.IsObject()) {
      return Fail(path, "expected an object");
    }
    DYNAMAP_RETURN_IF_ERROR(CheckMembers(obj, path, {"source", "index", "separator", "policy"}));

    ExtractedKeyRule rule;
    DYNAMAP_ASSIGN_OR_RETURN(auto source, RequiredString(obj, "source", path));
    rule.source_ = std::move(source);
    const auto* index = Member(obj, "index");
    if (index == nullptr || !index->IsUint()) {
      return Fail(path + ".index", "expected a non-negative integer");
    }
    rule.index_ = index->GetUint();
    DYNAMAP_ASSIGN_OR_RETURN(auto separator, OptionalString(obj, "separator", path));
    rule.separator_ = separator.value_or("#");
    DYNAMAP_ASSIGN_OR_RETURN(
        rule.policy_, OptionalEnum(obj, "policy", path, kPolicies, ExtractionPolicy::kDefault));
    return rule;
  }

  Result<RelationshipDescriptor> ParseRelationship(const JsonValue& obj, const std::string& path) {
    if (!obj.IsObject()) {
      return Fail(path, "expected an object");
    }
    DYNAMAP_RETURN_IF_ERROR(CheckMembers(obj, path, {"field", "pattern", "target", "collection"}));

    RelationshipDescriptor rel;
    DYNAMAP_ASSIGN_OR_RETURN(auto field, RequiredString(obj, "field", path));
    rel.target_field_name_ = std::move(field);
    DYNAMAP_ASSIGN_OR_RETURN(auto pattern, RequiredString(obj, "pattern", path));
    rel.sort_key_pattern_ = std::move(pattern);
    DYNAMAP_ASSIGN_OR_RETURN(auto target, RequiredString(obj, "target", path));
    rel.target_entity_id_ = std::move(target);
    DYNAMAP_ASSIGN_OR_RETURN(auto collection, OptionalBool(obj, "collection", path));
    rel.is_collection_ = collection.value_or(true);
    return rel;
  }

  Result<DiscriminatorRule> ParseDiscriminator(const JsonValue& obj, const std::string& path) {
    if (!obj.IsObject()) {
      return Fail(path, "expected an object");
    }
    DYNAMAP_RETURN_IF_ERROR(CheckMembers(obj, path, {"attribute", "value", "pattern", "sort_key"}));

    DiscriminatorRule rule;
    DYNAMAP_ASSIGN_OR_RETURN(auto attribute, OptionalString(obj, "attribute", path));
    rule.attribute_name_ = attribute.value_or("");
    DYNAMAP_ASSIGN_OR_RETURN(auto value, OptionalString(obj, "value", path));
    rule.attribute_value_ = value.value_or("");
    DYNAMAP_ASSIGN_OR_RETURN(auto pattern, OptionalString(obj, "pattern", path));
    rule.attribute_pattern_ = pattern.value_or("");
    DYNAMAP_ASSIGN_OR_RETURN(auto sort_key, OptionalString(obj, "sort_key", path));
    rule.sort_key_pattern_ = sort_key.value_or("");
    return rule;
  }

  //----------------------------------------------------------------------------
  // Member access
  //----------------------------------------------------------------------------

  static const JsonValue* Member(const JsonValue& obj, const char* key) {
    auto it = obj.FindMember(key);
    return it == obj.MemberEnd() ? nullptr : &it->value;
  }

  /// Rejects members outside the allowed names, typos would otherwise be
  /// dropped silently.
  Result<void> CheckMembers(const JsonValue& obj, const std::string& path,
                            std::initializer_list<std::string_view> allowed) {
    for (auto it = obj.MemberBegin(); it != obj.MemberEnd(); ++it) {
      std::string_view key(it->name.GetString(), it->name.GetStringLength());
      bool known = false;
      for (auto name : allowed) {
        known = known || name == key;
      }
      if (!known) {
        return Fail(path, std::format("unknown member \"{}\"", key));
      }
    }
    return {};
  }

  Result<std::optional<std::string>> OptionalString(const JsonValue& obj, const char* key,
                                                    const std::string& path) {
    const auto* value = Member(obj, key);
    if (value == nullptr || value->IsNull()) {
      return std::optional<std::string>();
    }
    if (!value->IsString()) {
      return Fail(std::format("{}.{}", path, key), "expected a string");
    }
    return std::optional<std::string>(std::string(value->GetString(), value->GetStringLength()));
  }

  Result<std::string> RequiredString(const JsonValue& obj, const char* key,
                                     const std::string& path) {
    DYNAMAP_ASSIGN_OR_RETURN(auto value, OptionalString(obj, key, path));
    if (!value || value->empty()) {
      return Fail(std::format("{}.{}", path, key), "missing required string");
    }
    return std::move(*value);
  }

  Result<std::optional<bool>> OptionalBool(const JsonValue& obj, const char* key,
                                           const std::string& path) {
    const auto* value = Member(obj, key);
    if (value == nullptr || value->IsNull()) {
      return std::optional<bool>();
    }
    if (!value->IsBool()) {
      return Fail(std::format("{}.{}", path, key), "expected true or false");
    }
    return std::optional<bool>(value->GetBool());
  }

  template <typename E, size_t N>
  Result<E> OptionalEnum(const JsonValue& obj, const char* key, const std::string& path,
                         const NamedValue<E> (&names)[N], E fallback) {
    DYNAMAP_ASSIGN_OR_RETURN(auto text, OptionalString(obj, key, path));
    if (!text) {
      return fallback;
    }
    for (const auto& named : names) {
      if (named.name_ == *text) {
        return named.value_;
      }
    }
    std::string expected;
    for (const auto& named : names) {
      expected += expected.empty() ? "" : ", ";
      expected += named.name_;
    }
    return Fail(std::format("{}.{}", path, key),
                std::format("unknown value \"{}\", expected one of: {}", *text, expected));
  }

  Error Fail(const std::string& path, const std::string& reason) {
    return Error::DefinitionParse(source_, std::format("{}: {}", path, reason));
  }

  std::string source_;
};

} // namespace

Result<std::vector<EntityDefinition>> DefinitionLoader::LoadString(std::string_view json,
                                                                   std::string_view source) {
  rapidjson::Document doc;
  doc.Parse(json.data(), json.size());
  if (doc.HasParseError()) {
    return Error::DefinitionParse(
        source, std::format("{} at offset {}", rapidjson::GetParseError_En(doc.GetParseError()),
                            doc.GetErrorOffset()));
  }

  DYNAMAP_ASSIGN_OR_RETURN(auto definitions, Parser(source).ParseRoot(doc));
  Log::Debug("Entity definitions loaded, source={}, entities={}", source, definitions.size());
  return definitions;
}

Result<std::vector<EntityDefinition>> DefinitionLoader::LoadFile(const std::string& path) {
  auto* file = std::fopen(path.c_str(), "rb");
  if (file == nullptr) {
    return Error::FileOpen(path, errno, strerror(errno));
  }

  std::string content;
  char buffer[4096];
  size_t read = 0;
  while ((read = std::fread(buffer, 1, sizeof(buffer), file)) > 0) {
    content.append(buffer, read);
  }
  if (std::ferror(file) != 0) {
    auto err = errno;
    std::fclose(file);
    return Error::FileRead(path, err, strerror(err));
  }
  std::fclose(file);

  return LoadString(content, path);
}

} // namespace dynamap
