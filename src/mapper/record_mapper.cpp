#include "dynamap/mapper/record_mapper.hpp"

#include "dynamap/base/log.hpp"
#include "dynamap/value/value_codec.hpp"

#include <exception>
#include <format>

namespace dynamap {

namespace {

constexpr std::string_view kEncrypt = "encrypt";
constexpr std::string_view kDecrypt = "decrypt";

Error HookFailed(const FieldDescriptor& field, const SchemaModel& schema, std::string_view op,
                 std::string_view cause) {
  return Error::EncryptionHookFailed(field.source_name_, op, cause)
      .WithContext("field", field.source_name_)
      .WithContext("schema", schema.entity_id());
}

/// Waits on a hook result in place.
Result<Binary> AwaitHook(std::future<Result<Binary>> future, const FieldDescriptor& field,
                         const SchemaModel& schema, std::string_view op) {
  if (!future.valid()) {
    return HookFailed(field, schema, op, "hook returned no result");
  }
  try {
    auto res = future.get();
    if (!res) {
      return HookFailed(field, schema, op, res.error().ToString());
    }
    return std::move(res.value());
  } catch (const std::exception& e) {
    return HookFailed(field, schema, op, e.what());
  }
}

/// Format of the text handed to the hook, chosen so that FromText() reads it
/// back unchanged.
std::string_view CanonicalFormat(const FieldDescriptor& field) {
  switch (field.scalar_type_) {
  case ScalarType::kNumber:
    return "G";
  case ScalarType::kDateTime:
    return "o";
  default:
    return {};
  }
}

} // namespace

//------------------------------------------------------------------------------
// Write path
//------------------------------------------------------------------------------

Result<RawRecord> RecordMapper::ToRecord(const Document& doc, const SchemaModel& schema) const {
  // derived keys are assigned on a copy, the caller's document stays intact
  Document working = doc;
  DYNAMAP_RETURN_IF_ERROR(keys_.ComputeAllDerived(working, schema));

  RawRecord record;
  for (const auto& field : schema.fields()) {
    if (!field.IsStored()) {
      continue;
    }

    const auto* value = working.Get(field.source_name_);
    if (value == nullptr) {
      if (field.IsPrimaryKey()) {
        return Error::IncompleteKeyMaterial(field.source_name_, field.source_name_)
            .WithContext("field", field.source_name_)
            .WithContext("schema", schema.entity_id());
      }
      if (field.store_null_) {
        record.insert_or_assign(field.stored_name_, AttributeValue::Null());
      }
      continue;
    }

    auto node = EncodeField(*value, field, schema);
    if (!node) {
      return std::move(node.error()).WithContext("schema", schema.entity_id());
    }
    if (node.value().IsNull() && !field.store_null_) {
      continue;
    }
    record.insert_or_assign(field.stored_name_, std::move(node.value()));
  }
  return record;
}

Result<AttributeValue> RecordMapper::EncodeField(const FieldValue& value,
                                                 const FieldDescriptor& field,
                                                 const SchemaModel& schema) const {
  if (field.encrypted_) {
    return Encrypt(value, field, schema);
  }
  if (field.scalar_type_ == ScalarType::kNested) {
    return EncodeNested(value, field);
  }
  return ValueCodec::Encode(value, field);
}

Result<AttributeValue> RecordMapper::EncodeNested(const FieldValue& value,
                                                  const FieldDescriptor& field) const {
  auto encode_one = [&](const FieldValue& item) -> Result<AttributeValue> {
    const auto* doc = item.AsDocument();
    if (doc == nullptr) {
      return Error::ConversionError(
                 field.source_name_, item.ToString(), ToString(field.scalar_type_),
                 std::format("expected a nested {} document", field.nested_->entity_id()))
          .WithContext("field", field.source_name_);
    }
    auto map = ToRecord(*doc, *field.nested_);
    if (!map) {
      return std::move(map.error()).WithContext("field", field.source_name_);
    }
    return AttributeValue::Map(std::move(map.value()));
  };

  if (!field.IsCollection()) {
    return encode_one(value);
  }

  const auto* items = value.AsList();
  if (items == nullptr) {
    return Error::ConversionError(field.source_name_, value.ToString(),
                                  ToString(field.scalar_type_),
                                  "expected a list of nested documents")
        .WithContext("field", field.source_name_);
  }
  if (items->empty()) {
    return AttributeValue::Null();
  }
  AttributeList nodes;
  nodes.reserve(items->size());
  for (const auto& item : *items) {
    DYNAMAP_ASSIGN_OR_RETURN(auto node, encode_one(item));
    nodes.push_back(std::move(node));
  }
  return AttributeValue::List(std::move(nodes));
}

Result<AttributeValue> RecordMapper::Encrypt(const FieldValue& value, const FieldDescriptor& field,
                                             const SchemaModel& schema) const {
  if (encryptor_ == nullptr) {
    return HookFailed(field, schema, kEncrypt, "no field encryptor is configured");
  }

  Binary plaintext;
  if (const auto* bytes = value.AsBinary(); bytes != nullptr) {
    plaintext = *bytes;
  } else {
    DYNAMAP_ASSIGN_OR_RETURN(auto text, ValueCodec::ToText(value, field, CanonicalFormat(field)));
    plaintext.assign(text.begin(), text.end());
  }

  FieldEncryptionContext context{schema.entity_id(), field.source_name_, field.stored_name_};
  DYNAMAP_ASSIGN_OR_RETURN(auto ciphertext,
                           AwaitHook(encryptor_->EncryptAsync(plaintext, context), field, schema,
                                     kEncrypt));
  return AttributeValue::Bytes(std::move(ciphertext));
}

//------------------------------------------------------------------------------
// Read path
//------------------------------------------------------------------------------

Result<Document> RecordMapper::FromRecord(const RawRecord& record,
                                          const SchemaModel& schema) const {
  Document doc;
  for (const auto& field : schema.fields()) {
    if (!field.IsStored()) {
      continue;
    }
    auto it = record.find(field.stored_name_);
    if (it == record.end() || it->second.IsNull()) {
      continue;
    }

    auto value = DecodeField(it->second, field, schema);
    if (!value) {
      return std::move(value.error())
          .WithContext("schema", schema.entity_id())
          .WithContext("record", RenderRecord(record, schema));
    }
    doc.Set(field.source_name_, std::move(value.value()));
  }

  if (auto res = keys_.ExtractAllComponents(doc, schema); !res) {
    return std::move(res.error()).WithContext("record", RenderRecord(record, schema));
  }

  for (const auto& field : schema.fields()) {
    if (field.IsRequired() && !doc.Has(field.source_name_)) {
      return Error::EntityConstructionFailed(
                 schema.entity_id(),
                 std::format("required field {} (attribute {}) is absent", field.source_name_,
                             field.stored_name_))
          .WithContext("field", field.source_name_)
          .WithContext("record", RenderRecord(record, schema));
    }
  }
  return doc;
}

Result<FieldValue> RecordMapper::DecodeField(const AttributeValue& node,
                                             const FieldDescriptor& field,
                                             const SchemaModel& schema) const {
  if (field.encrypted_) {
    return Decrypt(node, field, schema);
  }
  if (field.scalar_type_ == ScalarType::kNested) {
    return DecodeNested(node, field);
  }
  return ValueCodec::Decode(node, field);
}

Result<FieldValue> RecordMapper::DecodeNested(const AttributeValue& node,
                                              const FieldDescriptor& field) const {
  auto decode_one = [&](const AttributeValue& item) -> Result<FieldValue> {
    const auto* map = item.AsMap();
    if (map == nullptr) {
      return Error::ConversionError(
                 field.source_name_, item.ToString(), ToString(field.scalar_type_),
                 std::format("node of type {} is not a map", ToString(item.type())))
          .WithContext("field", field.source_name_);
    }
    auto doc = FromRecord(*map, *field.nested_);
    if (!doc) {
      return std::move(doc.error()).WithContext("field", field.source_name_);
    }
    return FieldValue(FieldValue::DocumentPtr(std::make_shared<Document>(std::move(doc.value()))));
  };

  if (!field.IsCollection()) {
    return decode_one(node);
  }

  const auto* items = node.AsList();
  if (items == nullptr) {
    return Error::ConversionError(field.source_name_, node.ToString(), ToString(field.scalar_type_),
                                  std::format("node of type {} is not a list",
                                              ToString(node.type())))
        .WithContext("field", field.source_name_);
  }
  FieldValue::List values;
  values.reserve(items->size());
  for (const auto& item : *items) {
    DYNAMAP_ASSIGN_OR_RETURN(auto value, decode_one(item));
    values.push_back(std::move(value));
  }
  return FieldValue(std::move(values));
}

Result<FieldValue> RecordMapper::Decrypt(const AttributeValue& node, const FieldDescriptor& field,
                                         const SchemaModel& schema) const {
  const auto* ciphertext = node.AsBinary();
  if (ciphertext == nullptr) {
    return Error::ConversionError(field.source_name_, "[ENCRYPTED]", ToString(field.scalar_type_),
                                  std::format("encrypted attribute holds a {} node, expected B",
                                              ToString(node.type())))
        .WithContext("field", field.source_name_);
  }
  if (encryptor_ == nullptr) {
    return HookFailed(field, schema, kDecrypt, "no field encryptor is configured");
  }

  FieldEncryptionContext context{schema.entity_id(), field.source_name_, field.stored_name_};
  DYNAMAP_ASSIGN_OR_RETURN(auto plaintext,
                           AwaitHook(encryptor_->DecryptAsync(*ciphertext, context), field, schema,
                                     kDecrypt));
  if (field.scalar_type_ == ScalarType::kBinary) {
    return FieldValue(std::move(plaintext));
  }
  std::string text(plaintext.begin(), plaintext.end());
  return ValueCodec::FromText(text, field, CanonicalFormat(field));
}

std::string RecordMapper::RenderRecord(const RawRecord& record, const SchemaModel& schema) const {
  if (!option_.redact_sensitive_) {
    return ToString(record);
  }
  return ToString(record, schema.sensitive_attributes());
}

} // namespace dynamap
