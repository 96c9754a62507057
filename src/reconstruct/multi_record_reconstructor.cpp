#include "dynamap/reconstruct/multi_record_reconstructor.hpp"

#include "dynamap/base/log.hpp"
#include "dynamap/discriminator/entity_discriminator.hpp"

#include <format>
#include <unordered_map>

namespace dynamap {

namespace {

/// Key text of a scalar attribute, empty when the attribute is absent or not
/// a key type.
std::string KeyTextOf(const RawRecord& record, const std::string& name) {
  auto it = record.find(name);
  return it == record.end() ? std::string() : it->second.KeyText();
}

} // namespace

Result<Reconstruction> MultiRecordReconstructor::Reconstruct(const std::vector<RawRecord>& records,
                                                             const SchemaModel& primary) const {
  const auto* partition_key = primary.partition_key();
  if (partition_key == nullptr) {
    return Error::InvalidArgument(
        std::format("shape {} has no partition key and cannot be reconstructed",
                    primary.entity_id()));
  }

  Reconstruction out;

  // group
  std::vector<Group> groups;
  std::unordered_map<std::string, size_t> group_index;
  size_t skipped = 0;
  for (const auto& record : records) {
    auto key = KeyTextOf(record, partition_key->stored_name_);
    if (key.empty()) {
      ++skipped;
      continue;
    }
    auto [it, inserted] = group_index.emplace(key, groups.size());
    if (inserted) {
      groups.push_back(Group{.partition_key_ = key, .records_ = {}});
    }
    groups[it->second].records_.push_back(&record);
  }
  if (skipped > 0) {
    out.warnings_.push_back(std::format("{} records without partition key attribute {} skipped",
                                        skipped, partition_key->stored_name_));
    Log::Warn("Reconstruct {}: {}", primary.entity_id(), out.warnings_.back());
  }

  // classify, assemble and emit
  for (const auto& group : groups) {
    if (auto res = Assemble(group, primary, out); !res) {
      return std::move(res.error()).WithContext("partition_key", group.partition_key_);
    }
  }

  DYNAMAP_DLOG("Reconstructed {} entities of {} from {} records in {} groups",
               out.entities_.size(), primary.entity_id(), records.size(), groups.size());
  return out;
}

Result<void> MultiRecordReconstructor::Assemble(const Group& group, const SchemaModel& primary,
                                                Reconstruction& out) const {
  const auto& relationships = primary.relationships();
  const auto* sort_key = primary.sort_key();

  const RawRecord* primary_record = nullptr;
  size_t extra_primaries = 0;
  std::vector<std::vector<const RawRecord*>> children(relationships.size());

  auto claim_by_relationship = [&](const RawRecord& record) {
    if (sort_key == nullptr) {
      return false;
    }
    auto sort_text = KeyTextOf(record, sort_key->stored_name_);
    for (size_t i = 0; i < relationships.size(); ++i) {
      const auto& rel = relationships[i];
      if (rel.matcher_.Matches(sort_text) && EntityDiscriminator::Matches(record, *rel.target_)) {
        children[i].push_back(&record);
        return true;
      }
    }
    return false;
  };

  for (const auto* record : group.records_) {
    // a primary recognized only by attribute presence yields to relationships
    auto rank = EntityDiscriminator::Evaluate(*record, primary);
    if (rank == MatchRank::kNone || rank == MatchRank::kPresence) {
      if (claim_by_relationship(*record) || rank == MatchRank::kNone) {
        continue;
      }
    }
    if (primary_record == nullptr) {
      primary_record = record;
    } else {
      ++extra_primaries;
    }
  }

  if (primary_record == nullptr) {
    out.warnings_.push_back(
        std::format("partition key {}: {} records without a primary {} record dropped",
                    group.partition_key_, group.records_.size(), primary.entity_id()));
    if (mapper_.option().warn_on_orphans_) {
      Log::Warn("Reconstruct {}: {}", primary.entity_id(), out.warnings_.back());
    }
    return {};
  }
  if (extra_primaries > 0) {
    out.warnings_.push_back(std::format("partition key {}: {} extra primary records ignored",
                                        group.partition_key_, extra_primaries));
    Log::Warn("Reconstruct {}: {}", primary.entity_id(), out.warnings_.back());
  }

  ReconstructedEntity entity;
  entity.partition_key_ = group.partition_key_;
  DYNAMAP_ASSIGN_OR_RETURN(entity.document_, mapper_.FromRecord(*primary_record, primary));

  for (size_t i = 0; i < relationships.size(); ++i) {
    const auto& rel = relationships[i];
    if (children[i].empty()) {
      continue;
    }

    auto matched = children[i].size();
    if (!rel.is_collection_ && matched > 1) {
      out.warnings_.push_back(
          std::format("partition key {}: singular relationship {} matches {} records, using the "
                      "first",
                      group.partition_key_, rel.target_field_name_, matched));
      Log::Warn("Reconstruct {}: {}", primary.entity_id(), out.warnings_.back());
      children[i].resize(1);
    }

    std::vector<Document> docs;
    docs.reserve(children[i].size());
    for (const auto* child : children[i]) {
      auto doc = mapper_.FromRecord(*child, *rel.target_);
      if (!doc) {
        return std::move(doc.error()).WithContext("relationship", rel.target_field_name_);
      }
      docs.push_back(std::move(doc.value()));
    }
    entity.child_records_ += docs.size();
    entity.document_.SetRelated(rel.target_field_name_, std::move(docs));
  }

  out.entities_.push_back(std::move(entity));
  return {};
}

} // namespace dynamap
