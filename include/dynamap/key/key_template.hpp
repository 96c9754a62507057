#pragma once

#include "dynamap/base/result.hpp"

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace dynamap {

/// Compiled positional key template, e.g. "TENANT#{0}#CUSTOMER#{1:D4}".
/// "{{" and "}}" stand for literal braces.
class KeyTemplate {
public:
  struct Segment {
    /// Literal text emitted before the placeholder.
    std::string literal_;

    /// Source index of the placeholder, -1 for a trailing literal.
    int32_t source_ = -1;

    /// Value format of the placeholder, empty for the canonical form.
    std::string format_;
  };

  KeyTemplate() = default;

  /// Parses a template referencing at most num_sources sources. Fails with
  /// InvalidArgument on unmatched braces, malformed or out-of-range indexes.
  static Result<KeyTemplate> Parse(std::string_view text, size_t num_sources);

  /// Joins sources with a separator, the shape used when no template is given.
  static KeyTemplate Join(size_t num_sources, std::string_view separator);

  const std::vector<Segment>& segments() const {
    return segments_;
  }

  bool Empty() const {
    return segments_.empty();
  }

private:
  std::vector<Segment> segments_;
};

} // namespace dynamap
