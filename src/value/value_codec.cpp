#include "dynamap/value/value_codec.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <chrono>
#include <cmath>
#include <format>
#include <limits>
#include <utility>

namespace dynamap {

namespace {

constexpr std::string_view kRedacted = "[REDACTED]";

struct NumberFormat {
  /// One of 'G', 'F', 'D', 'E'.
  char style_ = 'G';

  /// Digits after the point for F and E, minimum width for D. -1 for the
  /// style's default.
  int32_t precision_ = -1;
};

Result<NumberFormat> ParseNumberFormat(std::string_view format) {
  NumberFormat nf;
  if (format.empty()) {
    return nf;
  }
  char style = static_cast<char>(std::toupper(static_cast<unsigned char>(format[0])));
  if (style != 'G' && style != 'F' && style != 'D' && style != 'E') {
    return Error::InvalidArgument(std::format(
        "unsupported number format \"{}\", expected one of F<n>, D<n>, E<n>, G", format));
  }
  nf.style_ = style;
  auto digits = format.substr(1);
  if (!digits.empty()) {
    auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), nf.precision_);
    if (ec != std::errc() || ptr != digits.data() + digits.size() || nf.precision_ < 0 ||
        nf.precision_ > 20) {
      return Error::InvalidArgument(
          std::format("invalid precision in number format \"{}\", expected 0..20", format));
    }
  }
  return nf;
}

Result<std::string> FormatNumber(const FieldValue& value, const NumberFormat& nf) {
  const auto* i = value.AsInteger();
  const auto* d = value.AsDecimal();
  if (d != nullptr && !std::isfinite(*d)) {
    return Error::InvalidArgument(std::format("non-finite number {} cannot be stored", *d));
  }

  switch (nf.style_) {
  case 'F': {
    auto precision = nf.precision_ < 0 ? 2 : nf.precision_;
    return std::format("{:.{}f}", i != nullptr ? static_cast<double>(*i) : *d, precision);
  }
  case 'E': {
    auto precision = nf.precision_ < 0 ? 6 : nf.precision_;
    return std::format("{:.{}e}", i != nullptr ? static_cast<double>(*i) : *d, precision);
  }
  case 'D': {
    auto width = nf.precision_ < 0 ? 1 : nf.precision_;
    int64_t whole = 0;
    if (i != nullptr) {
      whole = *i;
    } else if (std::trunc(*d) == *d && std::fabs(*d) < 9.2e18) {
      whole = static_cast<int64_t>(*d);
    } else {
      return Error::InvalidArgument(
          std::format("format D requires an integral value, got {}", *d));
    }
    return std::format("{:0{}}", whole, width);
  }
  default:
    return i != nullptr ? std::format("{}", *i) : std::format("{}", *d);
  }
}

Result<FieldValue> ParseNumber(std::string_view text, NumberKind kind) {
  if (!text.empty() && text.front() == '+') {
    text.remove_prefix(1);
  }
  const char* begin = text.data();
  const char* end = text.data() + text.size();

  if (kind == NumberKind::kInteger) {
    int64_t i = 0;
    auto [ptr, ec] = std::from_chars(begin, end, i);
    if (ec == std::errc() && ptr == end) {
      return FieldValue(i);
    }
  }

  double d = 0;
  auto [ptr, ec] = std::from_chars(begin, end, d);
  if (ec != std::errc() || ptr != end || text.empty()) {
    return Error::InvalidArgument(std::format("\"{}\" is not a number", text));
  }
  if (kind == NumberKind::kDecimal) {
    return FieldValue(d);
  }
  // integral text written with a fixed point or scientific format
  if (std::trunc(d) != d || std::fabs(d) >= 9.2e18) {
    return Error::InvalidArgument(std::format("\"{}\" is not an integer", text));
  }
  return FieldValue(static_cast<int64_t>(d));
}

std::string ToHex(const Binary& bytes) {
  std::string out;
  out.reserve(bytes.size() * 2);
  for (auto b : bytes) {
    out += std::format("{:02x}", b);
  }
  return out;
}

Result<Binary> FromHex(std::string_view text) {
  if (text.size() % 2 != 0) {
    return Error::InvalidArgument(std::format("odd length hex text \"{}\"", text));
  }
  Binary out;
  out.reserve(text.size() / 2);
  for (size_t i = 0; i < text.size(); i += 2) {
    uint8_t byte = 0;
    auto [ptr, ec] = std::from_chars(text.data() + i, text.data() + i + 2, byte, 16);
    if (ec != std::errc() || ptr != text.data() + i + 2) {
      return Error::InvalidArgument(std::format("invalid hex text \"{}\"", text));
    }
    out.push_back(byte);
  }
  return out;
}

int32_t DefaultOffset(const TimezonePolicy& policy) {
  switch (policy.kind_) {
  case TimezoneKind::kFixedOffset:
    return policy.offset_minutes_;
  case TimezoneKind::kLocal:
    return LocalOffsetMinutes(std::chrono::time_point_cast<std::chrono::microseconds>(
        std::chrono::system_clock::now()));
  default:
    return 0;
  }
}

/// Parses with the field's pattern, ISO-8601 when the field declares none.
Result<DateTime> ParseDateTime(std::string_view text, const TimezonePolicy& policy,
                               std::string_view format) {
  auto parsed = DateTime::ParseExact(text, format, DefaultOffset(policy));
  if (!parsed) {
    return std::move(parsed.error());
  }
  return parsed.value().ToZone(policy);
}

Result<std::string> FormatDateTime(const DateTime& dt, const FieldDescriptor& field,
                                   std::string_view format) {
  return dt.ToZone(field.timezone_).Format(format);
}

std::string Render(const FieldDescriptor& field, const std::string& text) {
  return field.sensitive_ ? std::string(kRedacted) : text;
}

Error ConversionFailed(const FieldDescriptor& field, const std::string& node,
                       std::string_view cause) {
  return Error::ConversionError(field.source_name_, Render(field, node),
                                ToString(field.scalar_type_), cause)
      .WithContext("field", field.source_name_);
}

Error WrongDomainValue(const FieldDescriptor& field, const FieldValue& value) {
  return ConversionFailed(field, value.ToString(),
                          std::format("domain value of kind {} cannot be stored as {}",
                                      ToString(value.kind()), ToString(field.scalar_type_)));
}

Error WrongNode(const FieldDescriptor& field, const AttributeValue& node) {
  return ConversionFailed(field, node.ToString(),
                          std::format("node of type {} is incompatible with {}",
                                      ToString(node.type()), ToString(field.scalar_type_)));
}

} // namespace

//------------------------------------------------------------------------------
// Encode
//------------------------------------------------------------------------------

Result<AttributeValue> ValueCodec::Encode(const FieldValue& value, const FieldDescriptor& field) {
  if (!value.IsSet()) {
    return AttributeValue::Null();
  }
  if (field.IsCollection()) {
    return EncodeCollection(value, field);
  }
  return EncodeScalar(value, field);
}

Result<AttributeValue> ValueCodec::EncodeScalar(const FieldValue& value,
                                                const FieldDescriptor& field) {
  if (!value.IsSet()) {
    return AttributeValue::Null();
  }

  switch (field.scalar_type_) {
  case ScalarType::kString:
    if (const auto* s = value.AsString(); s != nullptr) {
      return AttributeValue::String(*s);
    }
    break;
  case ScalarType::kEnum:
    if (const auto* s = value.AsString(); s != nullptr) {
      return AttributeValue::String(*s);
    }
    if (const auto* i = value.AsInteger(); i != nullptr) {
      return AttributeValue::Number(std::format("{}", *i));
    }
    break;
  case ScalarType::kNumber: {
    if (value.AsInteger() == nullptr && value.AsDecimal() == nullptr) {
      break;
    }
    auto nf = ParseNumberFormat(field.format_);
    if (!nf) {
      return ConversionFailed(field, value.ToString(), nf.error().Message());
    }
    auto text = FormatNumber(value, nf.value());
    if (!text) {
      return ConversionFailed(field, value.ToString(), text.error().Message());
    }
    return AttributeValue::Number(std::move(text.value()));
  }
  case ScalarType::kBoolean:
    if (const auto* b = value.AsBool(); b != nullptr) {
      return AttributeValue::Bool(*b);
    }
    break;
  case ScalarType::kBinary:
    if (const auto* bin = value.AsBinary(); bin != nullptr) {
      return AttributeValue::Bytes(*bin);
    }
    break;
  case ScalarType::kDateTime:
    if (const auto* dt = value.AsDateTime(); dt != nullptr) {
      auto text = FormatDateTime(*dt, field, field.format_);
      if (!text) {
        return ConversionFailed(field, value.ToString(), text.error().Message());
      }
      return AttributeValue::String(std::move(text.value()));
    }
    break;
  case ScalarType::kNested:
    return ConversionFailed(field, value.ToString(), "nested values are mapped with their schema");
  }
  return WrongDomainValue(field, value);
}

Result<AttributeValue> ValueCodec::EncodeCollection(const FieldValue& value,
                                                    const FieldDescriptor& field) {
  const auto* items = value.AsList();
  if (items == nullptr) {
    return WrongDomainValue(field, value);
  }
  if (items->empty()) {
    return AttributeValue::Null();
  }

  AttributeList nodes;
  nodes.reserve(items->size());
  for (const auto& item : *items) {
    if (!item.IsSet()) {
      return ConversionFailed(field, value.ToString(), "collections cannot hold unset elements");
    }
    auto node = EncodeScalar(item, field);
    if (!node) {
      return std::move(node.error());
    }
    nodes.push_back(std::move(node.value()));
  }

  if (field.collection_ == CollectionKind::kList) {
    return AttributeValue::List(std::move(nodes));
  }

  // sets keep the first occurrence of each element
  switch (nodes.front().type()) {
  case AttributeType::kString: {
    std::vector<std::string> ss;
    for (const auto& node : nodes) {
      if (std::find(ss.begin(), ss.end(), *node.AsString()) == ss.end()) {
        ss.push_back(*node.AsString());
      }
    }
    return AttributeValue::StringSet(std::move(ss));
  }
  case AttributeType::kNumber: {
    std::vector<std::string> ns;
    for (const auto& node : nodes) {
      if (std::find(ns.begin(), ns.end(), *node.AsNumber()) == ns.end()) {
        ns.push_back(*node.AsNumber());
      }
    }
    return AttributeValue::NumberSet(std::move(ns));
  }
  case AttributeType::kBinary: {
    std::vector<Binary> bs;
    for (const auto& node : nodes) {
      if (std::find(bs.begin(), bs.end(), *node.AsBinary()) == bs.end()) {
        bs.push_back(*node.AsBinary());
      }
    }
    return AttributeValue::BinarySet(std::move(bs));
  }
  default:
    return ConversionFailed(
        field, value.ToString(),
        std::format("{} values cannot form a set", ToString(field.scalar_type_)));
  }
}

//------------------------------------------------------------------------------
// Decode
//------------------------------------------------------------------------------

Result<FieldValue> ValueCodec::Decode(const AttributeValue& node, const FieldDescriptor& field) {
  if (node.IsNull()) {
    return FieldValue();
  }
  if (field.IsCollection()) {
    return DecodeCollection(node, field);
  }
  return DecodeScalar(node, field);
}

Result<FieldValue> ValueCodec::DecodeScalar(const AttributeValue& node,
                                            const FieldDescriptor& field) {
  switch (field.scalar_type_) {
  case ScalarType::kString:
    if (const auto* s = node.AsString(); s != nullptr) {
      return FieldValue(*s);
    }
    break;
  case ScalarType::kEnum:
    if (const auto* s = node.AsString(); s != nullptr) {
      return FieldValue(*s);
    }
    if (const auto* n = node.AsNumber(); n != nullptr) {
      auto parsed = ParseNumber(*n, NumberKind::kInteger);
      if (!parsed) {
        return ConversionFailed(field, node.ToString(), parsed.error().Message());
      }
      return std::move(parsed.value());
    }
    break;
  case ScalarType::kNumber:
    if (const auto* n = node.AsNumber(); n != nullptr) {
      auto parsed = ParseNumber(*n, field.number_kind_);
      if (!parsed) {
        return ConversionFailed(field, node.ToString(), parsed.error().Message());
      }
      return std::move(parsed.value());
    }
    break;
  case ScalarType::kBoolean:
    if (const auto* b = node.AsBool(); b != nullptr) {
      return FieldValue(*b);
    }
    break;
  case ScalarType::kBinary:
    if (const auto* bin = node.AsBinary(); bin != nullptr) {
      return FieldValue(*bin);
    }
    break;
  case ScalarType::kDateTime:
    if (const auto* s = node.AsString(); s != nullptr) {
      auto parsed = ParseDateTime(*s, field.timezone_, field.format_);
      if (!parsed) {
        return ConversionFailed(field, node.ToString(), parsed.error().Message());
      }
      return FieldValue(parsed.value());
    }
    break;
  case ScalarType::kNested:
    return ConversionFailed(field, node.ToString(), "nested values are mapped with their schema");
  }
  return WrongNode(field, node);
}

Result<FieldValue> ValueCodec::DecodeCollection(const AttributeValue& node,
                                                const FieldDescriptor& field) {
  FieldValue::List items;
  auto decode_each = [&](auto&& elements, auto&& make_node) -> Result<void> {
    items.reserve(elements.size());
    for (const auto& element : elements) {
      auto item = DecodeScalar(make_node(element), field);
      if (!item) {
        return std::move(item.error());
      }
      items.push_back(std::move(item.value()));
    }
    return {};
  };

  Result<void> res;
  switch (node.type()) {
  case AttributeType::kStringSet:
    res = decode_each(*node.AsStringSet(),
                      [](const std::string& s) { return AttributeValue::String(s); });
    break;
  case AttributeType::kNumberSet:
    res = decode_each(*node.AsNumberSet(),
                      [](const std::string& n) { return AttributeValue::Number(n); });
    break;
  case AttributeType::kBinarySet:
    res = decode_each(*node.AsBinarySet(),
                      [](const Binary& b) { return AttributeValue::Bytes(b); });
    break;
  case AttributeType::kList:
    res = decode_each(*node.AsList(), [](const AttributeValue& v) -> const AttributeValue& {
      return v;
    });
    break;
  default:
    return WrongNode(field, node);
  }
  if (!res) {
    return std::move(res.error());
  }
  return FieldValue(std::move(items));
}

//------------------------------------------------------------------------------
// Key text
//------------------------------------------------------------------------------

Result<std::string> ValueCodec::ToText(const FieldValue& value, const FieldDescriptor& field,
                                       std::string_view format) {
  auto effective = format.empty() ? std::string_view(field.format_) : format;

  switch (value.kind()) {
  case ValueKind::kString:
    if (!format.empty()) {
      return ConversionFailed(field, value.ToString(),
                              std::format("format \"{}\" cannot be applied to a string", format));
    }
    return *value.AsString();
  case ValueKind::kInteger:
  case ValueKind::kDecimal: {
    auto nf = ParseNumberFormat(effective);
    if (!nf) {
      return ConversionFailed(field, value.ToString(), nf.error().Message());
    }
    auto text = FormatNumber(value, nf.value());
    if (!text) {
      return ConversionFailed(field, value.ToString(), text.error().Message());
    }
    return std::move(text.value());
  }
  case ValueKind::kBool:
    return std::string(*value.AsBool() ? "true" : "false");
  case ValueKind::kBinary:
    return ToHex(*value.AsBinary());
  case ValueKind::kDateTime: {
    auto text = FormatDateTime(*value.AsDateTime(), field, effective);
    if (!text) {
      return ConversionFailed(field, value.ToString(), text.error().Message());
    }
    return std::move(text.value());
  }
  default:
    return ConversionFailed(field, value.ToString(),
                            std::format("{} values cannot be rendered as key text",
                                        ToString(value.kind())));
  }
}

Result<FieldValue> ValueCodec::FromText(std::string_view text, const FieldDescriptor& field,
                                        std::string_view format) {
  auto effective = format.empty() ? std::string_view(field.format_) : format;
  auto fail = [&](std::string_view cause) {
    return ConversionFailed(field, std::format("\"{}\"", text), cause);
  };

  switch (field.scalar_type_) {
  case ScalarType::kString:
  case ScalarType::kEnum:
    return FieldValue(text);
  case ScalarType::kNumber: {
    auto parsed = ParseNumber(text, field.number_kind_);
    if (!parsed) {
      return fail(parsed.error().Message());
    }
    return std::move(parsed.value());
  }
  case ScalarType::kBoolean:
    if (text == "true" || text == "1") {
      return FieldValue(true);
    }
    if (text == "false" || text == "0") {
      return FieldValue(false);
    }
    return fail("expected true or false");
  case ScalarType::kBinary: {
    auto bytes = FromHex(text);
    if (!bytes) {
      return fail(bytes.error().Message());
    }
    return FieldValue(std::move(bytes.value()));
  }
  case ScalarType::kDateTime: {
    auto parsed = ParseDateTime(text, field.timezone_, effective);
    if (!parsed) {
      return fail(parsed.error().Message());
    }
    return FieldValue(parsed.value());
  }
  case ScalarType::kNested:
    break;
  }
  return fail("nested values cannot be parsed from key text");
}

Result<void> ValueCodec::ValidateFormat(const FieldDescriptor& field, std::string_view format) {
  if (format.empty()) {
    return {};
  }
  switch (field.scalar_type_) {
  case ScalarType::kNumber: {
    auto nf = ParseNumberFormat(format);
    if (!nf) {
      return std::move(nf.error());
    }
    return {};
  }
  case ScalarType::kDateTime: {
    // the pattern must read back what it renders, a one digit month catches
    // single letter tokens running into the next field
    auto sample = DateTime::FromCivil({.year_ = 2024,
                                       .month_ = 1,
                                       .day_ = 25,
                                       .hour_ = 13,
                                       .minute_ = 45,
                                       .second_ = 56,
                                       .micros_ = 123456});
    auto text = sample.Format(format);
    if (!text) {
      return std::move(text.error());
    }
    auto parsed = DateTime::ParseExact(text.value(), format);
    if (!parsed) {
      return Error::InvalidArgument(std::format("datetime format \"{}\" cannot be parsed back: {}",
                                                format, parsed.error().Message()));
    }
    return {};
  }
  default:
    return Error::InvalidArgument(std::format("format \"{}\" is not supported for {} fields",
                                              format, ToString(field.scalar_type_)));
  }
}

} // namespace dynamap
