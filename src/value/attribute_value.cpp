#include "dynamap/value/attribute_value.hpp"

#include <algorithm>
#include <format>

namespace dynamap {

namespace {

constexpr std::string_view kRedacted = "[REDACTED]";

std::string Quote(std::string_view s) {
  std::string out;
  out.reserve(s.size() + 2);
  out.push_back('"');
  for (char c : s) {
    switch (c) {
    case '"':
      out += "\\\"";
      break;
    case '\\':
      out += "\\\\";
      break;
    case '\n':
      out += "\\n";
      break;
    case '\t':
      out += "\\t";
      break;
    default:
      out.push_back(c);
    }
  }
  out.push_back('"');
  return out;
}

std::string Hex(const Binary& bytes) {
  std::string out;
  out.reserve(bytes.size() * 2);
  for (auto b : bytes) {
    out += std::format("{:02x}", b);
  }
  return out;
}

template <typename T, typename Fn>
std::string RenderArray(const std::vector<T>& items, Fn&& render) {
  std::string out = "[";
  for (size_t i = 0; i < items.size(); ++i) {
    if (i > 0) {
      out += ",";
    }
    out += render(items[i]);
  }
  return out + "]";
}

std::string RenderMap(const AttributeMap& map, const std::vector<std::string>& redacted_names) {
  std::string out = "{";
  bool first = true;
  for (const auto& [name, value] : map) {
    if (!first) {
      out += ",";
    }
    first = false;
    out += Quote(name);
    out += ":";
    bool redact =
        std::find(redacted_names.begin(), redacted_names.end(), name) != redacted_names.end();
    out += redact ? Quote(kRedacted) : value.ToString();
  }
  return out + "}";
}

} // namespace

std::string_view ToString(AttributeType type) {
  switch (type) {
  case AttributeType::kString:
    return "S";
  case AttributeType::kNumber:
    return "N";
  case AttributeType::kBinary:
    return "B";
  case AttributeType::kStringSet:
    return "SS";
  case AttributeType::kNumberSet:
    return "NS";
  case AttributeType::kBinarySet:
    return "BS";
  case AttributeType::kList:
    return "L";
  case AttributeType::kMap:
    return "M";
  case AttributeType::kBool:
    return "BOOL";
  case AttributeType::kNull:
    return "NULL";
  }
  return "UNKNOWN";
}

std::string AttributeValue::KeyText() const {
  switch (type()) {
  case AttributeType::kString:
    return *AsString();
  case AttributeType::kNumber:
    return *AsNumber();
  case AttributeType::kBinary:
    return Hex(*AsBinary());
  default:
    return {};
  }
}

std::string AttributeValue::ToString() const {
  auto tag = Quote(dynamap::ToString(type()));
  switch (type()) {
  case AttributeType::kString:
    return std::format("{{{}:{}}}", tag, Quote(*AsString()));
  case AttributeType::kNumber:
    return std::format("{{{}:{}}}", tag, Quote(*AsNumber()));
  case AttributeType::kBinary:
    return std::format("{{{}:{}}}", tag, Quote(Hex(*AsBinary())));
  case AttributeType::kStringSet:
    return std::format("{{{}:{}}}", tag, RenderArray(*AsStringSet(), Quote));
  case AttributeType::kNumberSet:
    return std::format("{{{}:{}}}", tag, RenderArray(*AsNumberSet(), Quote));
  case AttributeType::kBinarySet:
    return std::format("{{{}:{}}}", tag,
                       RenderArray(*AsBinarySet(), [](const Binary& b) { return Quote(Hex(b)); }));
  case AttributeType::kList:
    return std::format("{{{}:{}}}", tag, RenderArray(*AsList(), [](const AttributeValue& v) {
                         return v.ToString();
                       }));
  case AttributeType::kMap:
    return std::format("{{{}:{}}}", tag, RenderMap(*AsMap(), {}));
  case AttributeType::kBool:
    return std::format("{{{}:{}}}", tag, *AsBool() ? "true" : "false");
  case AttributeType::kNull:
    return std::format("{{{}:true}}", tag);
  }
  return "{}";
}

std::string ToString(const RawRecord& record, const std::vector<std::string>& redacted_names) {
  return RenderMap(record, redacted_names);
}

} // namespace dynamap
