#pragma once

#include "dynamap/base/result.hpp"
#include "dynamap/key/key_compiler.hpp"
#include "dynamap/mapper/document.hpp"
#include "dynamap/mapper/field_encryptor.hpp"
#include "dynamap/mapper_option.hpp"
#include "dynamap/schema/schema_model.hpp"
#include "dynamap/value/attribute_value.hpp"

#include <memory>
#include <string>
#include <string_view>
#include <utility>

namespace dynamap {

/// Converts documents to raw records and back for one schema at a time.
///
/// ToRecord():
///   1. computes derived fields in dependency order,
///   2. encodes every stored field,
///   3. omits unset values and empty collections, unless the field stores
///      nulls.
///
/// FromRecord():
///   1. decodes every stored attribute present in the record,
///   2. extracts key components,
///   3. checks required fields, failing with EntityConstructionFailed.
///
/// A Null node and an absent attribute read the same. Mapping is reentrant;
/// one mapper can be shared by any number of threads.
class RecordMapper {
public:
  explicit RecordMapper(const MapperOption& option = MapperOption{},
                        std::shared_ptr<FieldEncryptor> encryptor = nullptr)
      : option_(option),
        keys_(option),
        encryptor_(std::move(encryptor)) {
  }

  Result<RawRecord> ToRecord(const Document& doc, const SchemaModel& schema) const;

  Result<Document> FromRecord(const RawRecord& record, const SchemaModel& schema) const;

  /// Renders a record for log lines and error context, with the schema's
  /// sensitive attributes redacted when the option asks for it.
  std::string RenderRecord(const RawRecord& record, const SchemaModel& schema) const;

  const KeyCompiler& key_compiler() const {
    return keys_;
  }

  const MapperOption& option() const {
    return option_;
  }

private:
  Result<AttributeValue> EncodeField(const FieldValue& value, const FieldDescriptor& field,
                                     const SchemaModel& schema) const;
  Result<FieldValue> DecodeField(const AttributeValue& node, const FieldDescriptor& field,
                                 const SchemaModel& schema) const;

  Result<AttributeValue> EncodeNested(const FieldValue& value, const FieldDescriptor& field) const;
  Result<FieldValue> DecodeNested(const AttributeValue& node, const FieldDescriptor& field) const;

  Result<AttributeValue> Encrypt(const FieldValue& value, const FieldDescriptor& field,
                                 const SchemaModel& schema) const;
  Result<FieldValue> Decrypt(const AttributeValue& node, const FieldDescriptor& field,
                             const SchemaModel& schema) const;

  MapperOption option_;
  KeyCompiler keys_;
  std::shared_ptr<FieldEncryptor> encryptor_;
};

} // namespace dynamap
