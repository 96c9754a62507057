#pragma once

#include "dynamap/mapper_option.hpp"
#include "dynamap/schema/schema_model.hpp"
#include "dynamap/value/attribute_value.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace dynamap {

/// Which rule recognized a record, ordered by precedence.
enum class MatchRank : uint8_t {
  kNone = 0,
  kPresence,
  kSortKey,
  kAttribute,
};

std::string_view ToString(MatchRank rank);

/// Result of classifying one record among several shapes of a table.
struct Classification {
  /// Index of the chosen shape, -1 when no shape matches.
  int32_t index_ = -1;

  MatchRank rank_ = MatchRank::kNone;

  /// Entity ids of all the shapes matching at rank_, in configured order.
  std::vector<std::string> matches_;

  /// Set when more than one shape matches at the best rank.
  std::string warning_;

  bool Matched() const {
    return index_ >= 0;
  }

  bool Ambiguous() const {
    return matches_.size() > 1;
  }
};

/// Decides whether a raw record is an instance of a shape.
///
/// Rules, in precedence order:
///   1. discriminator attribute: decides whenever the record carries it,
///   2. sort-key pattern: decides when declared and rule 1 did not,
///   3. attribute presence: only for shapes declaring neither rule, all the
///      required stored attributes must be present.
/// A shape declaring a rule that does not apply to the record does not
/// match. Evaluation never fails, an unreadable record simply does not match.
class EntityDiscriminator {
public:
  explicit EntityDiscriminator(const MapperOption& option = MapperOption{}) : option_(option) {
  }

  static bool Matches(const RawRecord& record, const SchemaModel& schema) noexcept;

  /// The rule that recognized the record, kNone when it does not match.
  static MatchRank Evaluate(const RawRecord& record, const SchemaModel& schema) noexcept;

  /// Picks the shape with the best rank. Ties go to the first configured
  /// shape and are reported as a warning naming every tied shape.
  Classification Classify(const RawRecord& record, const std::vector<SchemaModelPtr>& shapes) const;

private:
  MapperOption option_;
};

} // namespace dynamap
