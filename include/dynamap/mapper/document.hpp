#pragma once

#include "dynamap/value/field_value.hpp"

#include <functional>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace dynamap {

/// The mapper's view of one domain object: field values keyed by source
/// (domain) field name, plus child documents populated by relationships.
///
/// Typed domain objects are converted to and from Documents by an
/// EntityBinding; the mapping core itself only deals with Documents.
class Document {
public:
  using FieldMap = std::map<std::string, FieldValue, std::less<>>;
  using RelatedMap = std::map<std::string, std::vector<Document>, std::less<>>;

  Document() = default;

  /// Returns the value of a field, nullptr when it is absent or unset.
  const FieldValue* Get(std::string_view name) const {
    auto it = fields_.find(name);
    if (it == fields_.end() || !it->second.IsSet()) {
      return nullptr;
    }
    return &it->second;
  }

  bool Has(std::string_view name) const {
    return Get(name) != nullptr;
  }

  /// Assigns a field. Assigning an unset value removes the field.
  void Set(std::string name, FieldValue value) {
    if (!value.IsSet()) {
      Unset(name);
      return;
    }
    fields_.insert_or_assign(std::move(name), std::move(value));
  }

  void Unset(std::string_view name) {
    auto it = fields_.find(name);
    if (it != fields_.end()) {
      fields_.erase(it);
    }
  }

  const FieldMap& fields() const {
    return fields_;
  }

  /// Child documents of a relationship field, nullptr when never assigned.
  const std::vector<Document>* Related(std::string_view name) const {
    auto it = related_.find(name);
    return it == related_.end() ? nullptr : &it->second;
  }

  void AddRelated(std::string_view name, Document child) {
    auto it = related_.find(name);
    if (it == related_.end()) {
      it = related_.emplace(std::string(name), std::vector<Document>{}).first;
    }
    it->second.push_back(std::move(child));
  }

  void SetRelated(std::string name, std::vector<Document> children) {
    related_.insert_or_assign(std::move(name), std::move(children));
  }

  const RelatedMap& related() const {
    return related_;
  }

  bool operator==(const Document& other) const {
    return fields_ == other.fields_ && related_ == other.related_;
  }

  bool operator!=(const Document& other) const {
    return !(*this == other);
  }

private:
  FieldMap fields_;
  RelatedMap related_;
};

} // namespace dynamap
