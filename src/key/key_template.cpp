#include "dynamap/key/key_template.hpp"

#include <charconv>

namespace dynamap {

Result<KeyTemplate> KeyTemplate::Parse(std::string_view text, size_t num_sources) {
  KeyTemplate tmpl;
  Segment current;

  for (size_t i = 0; i < text.size(); ++i) {
    char c = text[i];
    if (c == '{' && i + 1 < text.size() && text[i + 1] == '{') {
      current.literal_.push_back('{');
      ++i;
      continue;
    }
    if (c == '}' && i + 1 < text.size() && text[i + 1] == '}') {
      current.literal_.push_back('}');
      ++i;
      continue;
    }
    if (c == '}') {
      return Error::InvalidArgument(
          std::format("unmatched '}}' at position {} in key template \"{}\"", i, text));
    }
    if (c != '{') {
      current.literal_.push_back(c);
      continue;
    }

    auto close = text.find('}', i + 1);
    if (close == std::string_view::npos) {
      return Error::InvalidArgument(
          std::format("unmatched '{{' at position {} in key template \"{}\"", i, text));
    }
    auto body = text.substr(i + 1, close - i - 1);
    auto colon = body.find(':');
    auto index_part = body.substr(0, colon);
    if (colon != std::string_view::npos) {
      current.format_ = std::string(body.substr(colon + 1));
    }

    int32_t index = -1;
    const auto* end = index_part.data() + index_part.size();
    auto [ptr, ec] = std::from_chars(index_part.data(), end, index);
    if (ec != std::errc() || ptr != end || index < 0) {
      return Error::InvalidArgument(std::format(
          "invalid placeholder \"{{{}}}\" in key template \"{}\", indexes must be non-negative",
          body, text));
    }
    if (static_cast<size_t>(index) >= num_sources) {
      return Error::InvalidArgument(
          std::format("key template \"{}\" references source {} but only {} sources are declared",
                      text, index, num_sources));
    }

    current.source_ = index;
    tmpl.segments_.push_back(std::move(current));
    current = Segment{};
    i = close;
  }

  if (!current.literal_.empty() || tmpl.segments_.empty()) {
    tmpl.segments_.push_back(std::move(current));
  }
  return tmpl;
}

KeyTemplate KeyTemplate::Join(size_t num_sources, std::string_view separator) {
  KeyTemplate tmpl;
  for (size_t i = 0; i < num_sources; ++i) {
    Segment segment;
    if (i > 0) {
      segment.literal_ = std::string(separator);
    }
    segment.source_ = static_cast<int32_t>(i);
    tmpl.segments_.push_back(std::move(segment));
  }
  return tmpl;
}

} // namespace dynamap
