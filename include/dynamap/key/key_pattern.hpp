#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <utility>

namespace dynamap {

enum class PatternKind : uint8_t {
  /// No pattern declared, matches nothing.
  kNone = 0,
  /// "*", matches everything.
  kAny,
  kExact,
  kPrefix,
  kSuffix,
  kContains,
  /// Exact match or a leading "<literal>#" segment.
  kSegment,
  /// Wildcards in the middle, e.g. "ORDER#*#LINE#*".
  kGlob,
};

std::string_view ToString(PatternKind kind);

/// Compiled matcher for sort-key and discriminator values.
class KeyPattern {
public:
  KeyPattern() = default;

  /// Matches only the literal itself, '*' included.
  static KeyPattern Exact(std::string_view literal);

  /// Discriminator style: "X" exact, "X*" prefix, "*X" suffix, "*X*"
  /// contains, anything else with '*' is a glob.
  static KeyPattern Wildcard(std::string_view pattern);

  /// Relationship style: patterns with '*' follow Wildcard(), a plain literal
  /// matches exactly or as the leading segment before a '#'.
  static KeyPattern Segment(std::string_view pattern);

  bool Matches(std::string_view value) const noexcept;

  /// Conservative check whether some value could match both patterns.
  bool Overlaps(const KeyPattern& other) const noexcept;

  PatternKind kind() const {
    return kind_;
  }

  bool Empty() const {
    return kind_ == PatternKind::kNone;
  }

  /// The pattern as declared.
  const std::string& source() const {
    return source_;
  }

  /// Literal part the kind applies to, wildcards stripped.
  const std::string& literal() const {
    return literal_;
  }

  bool operator==(const KeyPattern& other) const {
    return kind_ == other.kind_ && literal_ == other.literal_ && source_ == other.source_;
  }

private:
  KeyPattern(PatternKind kind, std::string source, std::string literal)
      : kind_(kind),
        source_(std::move(source)),
        literal_(std::move(literal)) {
  }

  static bool GlobMatch(std::string_view pattern, std::string_view value) noexcept;

  PatternKind kind_ = PatternKind::kNone;
  std::string source_;
  std::string literal_;
};

} // namespace dynamap
