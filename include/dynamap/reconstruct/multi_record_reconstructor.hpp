#pragma once

#include "dynamap/base/result.hpp"
#include "dynamap/mapper/document.hpp"
#include "dynamap/mapper/record_mapper.hpp"
#include "dynamap/schema/schema_model.hpp"
#include "dynamap/value/attribute_value.hpp"

#include <string>
#include <utility>
#include <vector>

namespace dynamap {

/// One logical entity assembled from the records of a partition-key group.
struct ReconstructedEntity {
  /// Key text of the group's partition key.
  std::string partition_key_;

  Document document_;

  /// Number of child records assigned to relationships.
  size_t child_records_ = 0;
};

struct Reconstruction {
  /// In order of first appearance of each partition key in the input.
  std::vector<ReconstructedEntity> entities_;

  /// Non-fatal problems: orphaned groups, extra primary records, singular
  /// relationships with several matches, records without a partition key.
  std::vector<std::string> warnings_;
};

/// Assembles entities stored as several records sharing a partition key.
///
/// 1. Group: records are grouped by partition key text, groups keep the
///    order in which their key first appears.
/// 2. Classify: the first record of a group recognized as the primary shape
///    is the primary record; every other record is given to the first
///    relationship whose sort-key pattern and target shape both match it.
///    When the primary shape is recognized only by attribute presence,
///    relationships claim their records first.
/// 3. Assemble: the primary record is mapped with the primary schema, child
///    records with their relationship's target schema, in input order.
/// 4. Emit: one entity per group with a primary record. Groups without one
///    are dropped with a warning.
class MultiRecordReconstructor {
public:
  explicit MultiRecordReconstructor(RecordMapper mapper = RecordMapper())
      : mapper_(std::move(mapper)) {
  }

  /// Fails with the first mapping error of any assembled record. The error
  /// carries the partition key of the group.
  Result<Reconstruction> Reconstruct(const std::vector<RawRecord>& records,
                                     const SchemaModel& primary) const;

private:
  struct Group {
    std::string partition_key_;
    std::vector<const RawRecord*> records_;
  };

  Result<void> Assemble(const Group& group, const SchemaModel& primary,
                        Reconstruction& out) const;

  RecordMapper mapper_;
};

} // namespace dynamap
