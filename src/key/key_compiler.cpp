#include "dynamap/key/key_compiler.hpp"

#include "dynamap/base/log.hpp"
#include "dynamap/value/value_codec.hpp"

#include <format>
namespace dynamap {

Result<void> KeyCompiler::ComputeDerived(Document& doc, const SchemaModel& schema,
                                         const FieldDescriptor& field) const {
  if (!field.derived_) {
    return Error::InvalidArgument(
        std::format("field {}.{} is not derived", schema.entity_id(), field.source_name_));
  }

  const auto& rule = *field.derived_;
  std::string key;
  for (const auto& segment : rule.compiled_.segments()) {
    key += segment.literal_;
    if (segment.source_ < 0) {
      continue;
    }

    const auto& source = schema.fields()[rule.source_indexes_[segment.source_]];
    const auto* value = doc.Get(source.source_name_);
    if (value == nullptr) {
      if (!field.IsRequired()) {
        DYNAMAP_DLOG("Derived field left unset, schema={}, field={}, missing_source={}",
                     schema.entity_id(), field.source_name_, source.source_name_);
        doc.Unset(field.source_name_);
        return {};
      }
      return Error::IncompleteKeyMaterial(field.source_name_, source.source_name_)
          .WithContext("field", field.source_name_)
          .WithContext("schema", schema.entity_id());
    }

    auto text = ValueCodec::ToText(*value, source, segment.format_);
    if (!text) {
      return std::move(text.error())
          .WithContext("derived_field", field.source_name_)
          .WithContext("schema", schema.entity_id());
    }
    key += text.value();
  }

  doc.Set(field.source_name_, FieldValue(std::move(key)));
  return {};
}

Result<void> KeyCompiler::ComputeAllDerived(Document& doc, const SchemaModel& schema) const {
  for (auto idx : schema.derive_order()) {
    DYNAMAP_RETURN_IF_ERROR(ComputeDerived(doc, schema, schema.fields()[idx]));
  }
  return {};
}

Result<void> KeyCompiler::ExtractComponents(Document& doc, const SchemaModel& schema,
                                            const FieldDescriptor& field) const {
  if (!field.extracted_) {
    return Error::InvalidArgument(
        std::format("field {}.{} is not extracted", schema.entity_id(), field.source_name_));
  }

  const auto& rule = *field.extracted_;
  const auto& source = schema.fields()[rule.source_index_];
  const auto* value = doc.Get(source.source_name_);
  if (value == nullptr) {
    doc.Unset(field.source_name_);
    return {};
  }

  const auto* text = value->AsString();
  if (text == nullptr) {
    return Error::ConversionError(field.source_name_, value->ToString(),
                                  ToString(field.scalar_type_),
                                  std::format("source {} does not hold key text",
                                              source.source_name_))
        .WithContext("field", field.source_name_)
        .WithContext("schema", schema.entity_id());
  }

  auto components = Split(*text, rule.separator_);
  if (rule.index_ >= components.size()) {
    if (EffectivePolicy(rule) == ExtractionPolicy::kStrict) {
      auto shown = source.sensitive_ && option_.redact_sensitive_ ? std::string("[REDACTED]")
                                                                  : std::format("\"{}\"", *text);
      return Error::ConversionError(field.source_name_, shown, ToString(field.scalar_type_),
                                    std::format("key has {} components, component {} requested",
                                                components.size(), rule.index_))
          .WithContext("field", field.source_name_)
          .WithContext("schema", schema.entity_id());
    }
    Log::Warn("Key component missing, schema={}, field={}, source={}, components={}, index={}",
              schema.entity_id(), field.source_name_, source.source_name_, components.size(),
              rule.index_);
    doc.Unset(field.source_name_);
    return {};
  }

  auto parsed = ValueCodec::FromText(components[rule.index_], field);
  if (!parsed) {
    return std::move(parsed.error()).WithContext("schema", schema.entity_id());
  }
  doc.Set(field.source_name_, std::move(parsed.value()));
  return {};
}

Result<void> KeyCompiler::ExtractAllComponents(Document& doc, const SchemaModel& schema) const {
  for (auto idx : schema.extract_order()) {
    DYNAMAP_RETURN_IF_ERROR(ExtractComponents(doc, schema, schema.fields()[idx]));
  }
  return {};
}

ExtractionPolicy KeyCompiler::EffectivePolicy(const ExtractedKeyRule& rule) const {
  if (rule.policy_ != ExtractionPolicy::kDefault) {
    return rule.policy_;
  }
  return option_.extraction_policy_ == ExtractionPolicy::kStrict ? ExtractionPolicy::kStrict
                                                                  : ExtractionPolicy::kLenient;
}

std::vector<std::string_view> KeyCompiler::Split(std::string_view text,
                                                 std::string_view separator) {
  std::vector<std::string_view> parts;
  if (separator.empty()) {
    parts.push_back(text);
    return parts;
  }
  size_t begin = 0;
  while (true) {
    auto pos = text.find(separator, begin);
    if (pos == std::string_view::npos) {
      parts.push_back(text.substr(begin));
      break;
    }
    parts.push_back(text.substr(begin, pos - begin));
    begin = pos + separator.size();
  }
  return parts;
}

} // namespace dynamap
