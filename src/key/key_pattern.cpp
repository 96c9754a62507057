#include "dynamap/key/key_pattern.hpp"

#include <algorithm>
#include <cstddef>

namespace dynamap {

std::string_view ToString(PatternKind kind) {
  switch (kind) {
  case PatternKind::kNone:
    return "NONE";
  case PatternKind::kAny:
    return "ANY";
  case PatternKind::kExact:
    return "EXACT";
  case PatternKind::kPrefix:
    return "PREFIX";
  case PatternKind::kSuffix:
    return "SUFFIX";
  case PatternKind::kContains:
    return "CONTAINS";
  case PatternKind::kSegment:
    return "SEGMENT";
  case PatternKind::kGlob:
    return "GLOB";
  }
  return "UNKNOWN";
}

KeyPattern KeyPattern::Exact(std::string_view literal) {
  return KeyPattern(PatternKind::kExact, std::string(literal), std::string(literal));
}

KeyPattern KeyPattern::Wildcard(std::string_view pattern) {
  std::string source(pattern);
  if (pattern.empty()) {
    return KeyPattern();
  }

  auto stars = std::count(pattern.begin(), pattern.end(), '*');
  if (stars == 0) {
    return KeyPattern(PatternKind::kExact, source, source);
  }
  if (stars == static_cast<std::ptrdiff_t>(pattern.size())) {
    return KeyPattern(PatternKind::kAny, source, "");
  }

  bool leading = pattern.front() == '*';
  bool trailing = pattern.back() == '*';
  if (stars == 1 && trailing) {
    return KeyPattern(PatternKind::kPrefix, source,
                      std::string(pattern.substr(0, pattern.size() - 1)));
  }
  if (stars == 1 && leading) {
    return KeyPattern(PatternKind::kSuffix, source, std::string(pattern.substr(1)));
  }
  if (stars == 2 && leading && trailing) {
    return KeyPattern(PatternKind::kContains, source,
                      std::string(pattern.substr(1, pattern.size() - 2)));
  }
  return KeyPattern(PatternKind::kGlob, source, source);
}

KeyPattern KeyPattern::Segment(std::string_view pattern) {
  if (pattern.find('*') != std::string_view::npos) {
    return Wildcard(pattern);
  }
  if (pattern.empty()) {
    return KeyPattern();
  }
  return KeyPattern(PatternKind::kSegment, std::string(pattern), std::string(pattern));
}

bool KeyPattern::Matches(std::string_view value) const noexcept {
  switch (kind_) {
  case PatternKind::kNone:
    return false;
  case PatternKind::kAny:
    return true;
  case PatternKind::kExact:
    return value == literal_;
  case PatternKind::kPrefix:
    return value.starts_with(literal_);
  case PatternKind::kSuffix:
    return value.ends_with(literal_);
  case PatternKind::kContains:
    return value.find(literal_) != std::string_view::npos;
  case PatternKind::kSegment:
    return value == literal_ ||
           (value.size() > literal_.size() && value.starts_with(literal_) &&
            value[literal_.size()] == '#');
  case PatternKind::kGlob:
    return GlobMatch(literal_, value);
  }
  return false;
}

bool KeyPattern::Overlaps(const KeyPattern& other) const noexcept {
  if (Empty() || other.Empty()) {
    return false;
  }
  if (kind_ == PatternKind::kExact || kind_ == PatternKind::kSegment) {
    if (other.Matches(literal_)) {
      return true;
    }
  }
  if (other.kind_ == PatternKind::kExact || other.kind_ == PatternKind::kSegment) {
    if (Matches(other.literal_)) {
      return true;
    }
  }

  auto is_prefix_like = [](PatternKind k) {
    return k == PatternKind::kPrefix || k == PatternKind::kSegment;
  };
  if (is_prefix_like(kind_) && is_prefix_like(other.kind_)) {
    return literal_.starts_with(other.literal_) || other.literal_.starts_with(literal_);
  }
  if (kind_ == PatternKind::kSuffix && other.kind_ == PatternKind::kSuffix) {
    return literal_.ends_with(other.literal_) || other.literal_.ends_with(literal_);
  }
  if (kind_ == PatternKind::kExact || other.kind_ == PatternKind::kExact) {
    // exact literals were tested against the other side above
    return false;
  }
  return true;
}

bool KeyPattern::GlobMatch(std::string_view pattern, std::string_view value) noexcept {
  size_t p = 0;
  size_t v = 0;
  size_t star = std::string_view::npos;
  size_t resume = 0;
  while (v < value.size()) {
    if (p < pattern.size() && pattern[p] != '*' && pattern[p] == value[v]) {
      ++p;
      ++v;
    } else if (p < pattern.size() && pattern[p] == '*') {
      star = p++;
      resume = v;
    } else if (star != std::string_view::npos) {
      p = star + 1;
      v = ++resume;
    } else {
      return false;
    }
  }
  while (p < pattern.size() && pattern[p] == '*') {
    ++p;
  }
  return p == pattern.size();
}

} // namespace dynamap
