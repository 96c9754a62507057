#include "dynamap/value/field_value.hpp"

#include "dynamap/mapper/document.hpp"

#include <format>
namespace dynamap {

std::string_view ToString(ValueKind kind) {
  switch (kind) {
  case ValueKind::kUnset:
    return "UNSET";
  case ValueKind::kBool:
    return "BOOL";
  case ValueKind::kInteger:
    return "INTEGER";
  case ValueKind::kDecimal:
    return "DECIMAL";
  case ValueKind::kString:
    return "STRING";
  case ValueKind::kBinary:
    return "BINARY";
  case ValueKind::kDateTime:
    return "DATETIME";
  case ValueKind::kList:
    return "LIST";
  case ValueKind::kDocument:
    return "DOCUMENT";
  }
  return "UNKNOWN";
}

std::string FieldValue::ToString() const {
  switch (kind()) {
  case ValueKind::kUnset:
    return "<unset>";
  case ValueKind::kBool:
    return *AsBool() ? "true" : "false";
  case ValueKind::kInteger:
    return std::format("{}", *AsInteger());
  case ValueKind::kDecimal:
    return std::format("{}", *AsDecimal());
  case ValueKind::kString:
    return std::format("\"{}\"", *AsString());
  case ValueKind::kBinary:
    return std::format("<{} bytes>", AsBinary()->size());
  case ValueKind::kDateTime:
    return AsDateTime()->ToIsoString();
  case ValueKind::kList: {
    std::string out = "[";
    for (const auto& item : *AsList()) {
      if (out.size() > 1) {
        out += ", ";
      }
      out += item.ToString();
    }
    return out + "]";
  }
  case ValueKind::kDocument: {
    std::string out = "{";
    const auto* doc = AsDocument();
    if (doc != nullptr) {
      for (const auto& [name, value] : doc->fields()) {
        if (out.size() > 1) {
          out += ", ";
        }
        out += std::format("{}: {}", name, value.ToString());
      }
    }
    return out + "}";
  }
  }
  return "<unknown>";
}

bool FieldValue::operator==(const FieldValue& other) const {
  if (kind() != other.kind()) {
    return false;
  }
  if (kind() == ValueKind::kDocument) {
    const auto* lhs = AsDocument();
    const auto* rhs = other.AsDocument();
    if (lhs == nullptr || rhs == nullptr) {
      return lhs == rhs;
    }
    return *lhs == *rhs;
  }
  return storage_ == other.storage_;
}

} // namespace dynamap
