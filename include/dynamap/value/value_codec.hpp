#pragma once

#include "dynamap/base/result.hpp"
#include "dynamap/schema/field_descriptor.hpp"
#include "dynamap/value/attribute_value.hpp"
#include "dynamap/value/field_value.hpp"

#include <string>
#include <string_view>

namespace dynamap {

/// Codec to transform typed FieldValues into attribute value nodes and back,
/// one field at a time. Nested shapes are handled by the RecordMapper.
///
/// Formats:
///   - numbers: "F<n>" fixed point, "D<n>" zero padded integer, "E<n>"
///     scientific, "G" or empty for the canonical shortest form. Applied on
///     encode only, decode reads any numeric text.
///   - datetimes: the pattern tokens of DateTime::Format(). Decode parses
///     with the same pattern, ISO-8601 when the field declares none.
class ValueCodec {
public:
  /// Encodes a domain value. An unset value, or an empty collection, encodes
  /// to a Null node; the caller decides whether to store or omit it.
  static Result<AttributeValue> Encode(const FieldValue& value, const FieldDescriptor& field);

  /// Decodes a node. A Null node decodes to an unset value. Fails with
  /// ConversionError when the node variant is incompatible with the field.
  static Result<FieldValue> Decode(const AttributeValue& node, const FieldDescriptor& field);

  /// Renders a scalar value as key text, using format when not empty and the
  /// field's own format otherwise.
  static Result<std::string> ToText(const FieldValue& value, const FieldDescriptor& field,
                                    std::string_view format = {});

  /// Parses key text back into a scalar value of the field's type, using
  /// format when not empty and the field's own format otherwise.
  static Result<FieldValue> FromText(std::string_view text, const FieldDescriptor& field,
                                     std::string_view format = {});

  /// Checks that a format can be applied to values of the field's type, and
  /// for datetimes that text rendered with it parses back.
  static Result<void> ValidateFormat(const FieldDescriptor& field, std::string_view format);

private:
  static Result<AttributeValue> EncodeScalar(const FieldValue& value, const FieldDescriptor& field);
  static Result<FieldValue> DecodeScalar(const AttributeValue& node, const FieldDescriptor& field);
  static Result<AttributeValue> EncodeCollection(const FieldValue& value,
                                                 const FieldDescriptor& field);
  static Result<FieldValue> DecodeCollection(const AttributeValue& node,
                                             const FieldDescriptor& field);
};

} // namespace dynamap
