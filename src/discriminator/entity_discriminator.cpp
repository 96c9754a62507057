#include "dynamap/discriminator/entity_discriminator.hpp"

#include "dynamap/base/log.hpp"

#include <exception>
#include <format>
#include <string>

namespace dynamap {

namespace {

/// Reads the text of a scalar attribute, false when absent or not S, N or B.
bool AttributeText(const RawRecord& record, std::string_view name, std::string& out) {
  auto it = record.find(name);
  if (it == record.end()) {
    return false;
  }
  switch (it->second.type()) {
  case AttributeType::kString:
  case AttributeType::kNumber:
  case AttributeType::kBinary:
    out = it->second.KeyText();
    return true;
  default:
    return false;
  }
}

bool HasRequiredAttributes(const RawRecord& record, const SchemaModel& schema) {
  for (const auto& field : schema.fields()) {
    if (!field.IsRequired()) {
      continue;
    }
    auto it = record.find(field.stored_name_);
    if (it == record.end() || it->second.IsNull()) {
      return false;
    }
  }
  return true;
}

} // namespace

std::string_view ToString(MatchRank rank) {
  switch (rank) {
  case MatchRank::kNone:
    return "NONE";
  case MatchRank::kPresence:
    return "PRESENCE";
  case MatchRank::kSortKey:
    return "SORT_KEY";
  case MatchRank::kAttribute:
    return "ATTRIBUTE";
  }
  return "UNKNOWN";
}

bool EntityDiscriminator::Matches(const RawRecord& record, const SchemaModel& schema) noexcept {
  return Evaluate(record, schema) != MatchRank::kNone;
}

MatchRank EntityDiscriminator::Evaluate(const RawRecord& record,
                                        const SchemaModel& schema) noexcept {
  try {
    const auto& rule = schema.discriminator();
    std::string text;

    if (rule.HasAttributeRule() && AttributeText(record, rule.attribute_name_, text)) {
      return rule.attribute_matcher_.Matches(text) ? MatchRank::kAttribute : MatchRank::kNone;
    }

    if (rule.HasSortKeyRule()) {
      const auto* sort_key = schema.sort_key();
      if (sort_key != nullptr && AttributeText(record, sort_key->stored_name_, text) &&
          rule.sort_key_matcher_.Matches(text)) {
        return MatchRank::kSortKey;
      }
      return MatchRank::kNone;
    }

    if (rule.HasAttributeRule()) {
      return MatchRank::kNone;
    }
    return HasRequiredAttributes(record, schema) ? MatchRank::kPresence : MatchRank::kNone;
  } catch (const std::exception& e) {
    // only allocation failures can get here, treat the record as unreadable
    Log::Error("Discriminator evaluation failed, schema={}, error={}", schema.entity_id(),
               e.what());
    return MatchRank::kNone;
  }
}

Classification EntityDiscriminator::Classify(const RawRecord& record,
                                             const std::vector<SchemaModelPtr>& shapes) const {
  Classification result;
  for (size_t i = 0; i < shapes.size(); ++i) {
    auto rank = Evaluate(record, *shapes[i]);
    if (rank == MatchRank::kNone || rank < result.rank_) {
      continue;
    }
    if (rank > result.rank_) {
      result.index_ = static_cast<int32_t>(i);
      result.rank_ = rank;
      result.matches_.clear();
    }
    result.matches_.push_back(shapes[i]->entity_id());
  }

  if (result.Ambiguous()) {
    std::string names;
    for (const auto& name : result.matches_) {
      names += names.empty() ? name : ", " + name;
    }
    result.warning_ = std::format("record matches shapes [{}] by {}, using {}", names,
                                  ToString(result.rank_), result.matches_.front());
    if (option_.warn_on_ambiguous_shapes_) {
      Log::Warn("Ambiguous discrimination: {}", result.warning_);
    }
  }
  return result;
}

} // namespace dynamap
