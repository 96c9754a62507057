#pragma once

#include "dynamap/base/result.hpp"
#include "dynamap/mapper/document.hpp"
#include "dynamap/mapper/record_mapper.hpp"
#include "dynamap/mapper/value_traits.hpp"
#include "dynamap/reconstruct/multi_record_reconstructor.hpp"
#include "dynamap/schema/schema_model.hpp"

#include <format>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace dynamap {

/// Binds the members of a C++ struct to the fields of a schema, so typed
/// objects are mapped without reflection. Members are bound by member
/// pointer, their types converted with ValueTraits.
///
/// Example usage:
///   auto line = std::make_shared<EntityBinding<OrderLine>>(line_schema);
///   line->Field("pk", &OrderLine::pk_).Field("sku", &OrderLine::sku_);
///
///   EntityBinding<Order> order(order_schema);
///   order.Field("pk", &Order::pk_)
///       .Field("total", &Order::total_)
///       .Related("lines", &Order::lines_, line);
///   auto record = order.ToRecord(o, mapper);
template <typename T>
class EntityBinding {
public:
  explicit EntityBinding(SchemaModelPtr schema) : schema_(std::move(schema)) {
  }

  const SchemaModelPtr& schema() const {
    return schema_;
  }

  /// Binds a scalar, optional or collection member to a schema field.
  template <typename M>
  EntityBinding& Field(std::string name, M T::*member) {
    auto field_name = name;
    fields_.push_back(FieldBinding{
        .name_ = std::move(name),
        .get_ = [member](const T& obj) { return ValueTraits<M>::To(obj.*member); },
        .set_ = [member, field_name](T& obj, const FieldValue& value) -> Result<void> {
          if (!ValueTraits<M>::From(value, obj.*member)) {
            return MemberMismatch(field_name, value, ValueTraits<M>::kTypeName);
          }
          return {};
        },
    });
    return *this;
  }

  /// Binds a struct member to a nested field, mapped with the child binding.
  template <typename C>
  EntityBinding& Nested(std::string name, C T::*member,
                        std::shared_ptr<const EntityBinding<C>> child) {
    auto field_name = name;
    fields_.push_back(FieldBinding{
        .name_ = std::move(name),
        .get_ = [member, child](const T& obj) {
          return FieldValue(FieldValue::DocumentPtr(
              std::make_shared<Document>(child->ToDocument(obj.*member))));
        },
        .set_ = [member, child, field_name](T& obj, const FieldValue& value) -> Result<void> {
          const auto* doc = value.AsDocument();
          if (doc == nullptr) {
            return MemberMismatch(field_name, value, "nested document");
          }
          DYNAMAP_ASSIGN_OR_RETURN(obj.*member, child->FromDocument(*doc));
          return {};
        },
    });
    return *this;
  }

  /// Binds a collection relationship.
  template <typename C>
  EntityBinding& Related(std::string name, std::vector<C> T::*member,
                         std::shared_ptr<const EntityBinding<C>> child) {
    related_.push_back(RelatedBinding{
        .name_ = std::move(name),
        .get_ = [member, child](const T& obj) {
          std::vector<Document> docs;
          docs.reserve((obj.*member).size());
          for (const auto& item : obj.*member) {
            docs.push_back(child->ToDocument(item));
          }
          return docs;
        },
        .set_ = [member, child](T& obj, const std::vector<Document>& docs) -> Result<void> {
          auto& items = obj.*member;
          items.clear();
          items.reserve(docs.size());
          for (const auto& doc : docs) {
            DYNAMAP_ASSIGN_OR_RETURN(auto item, child->FromDocument(doc));
            items.push_back(std::move(item));
          }
          return {};
        },
    });
    return *this;
  }

  /// Binds a singular relationship.
  template <typename C>
  EntityBinding& Related(std::string name, std::optional<C> T::*member,
                         std::shared_ptr<const EntityBinding<C>> child) {
    related_.push_back(RelatedBinding{
        .name_ = std::move(name),
        .get_ = [member, child](const T& obj) {
          std::vector<Document> docs;
          if ((obj.*member).has_value()) {
            docs.push_back(child->ToDocument(*(obj.*member)));
          }
          return docs;
        },
        .set_ = [member, child](T& obj, const std::vector<Document>& docs) -> Result<void> {
          if (docs.empty()) {
            (obj.*member).reset();
            return {};
          }
          DYNAMAP_ASSIGN_OR_RETURN(auto item, child->FromDocument(docs.front()));
          obj.*member = std::move(item);
          return {};
        },
    });
    return *this;
  }

  /// Checks every bound name against the schema.
  Result<void> Validate() const {
    for (const auto& binding : fields_) {
      if (schema_->FindField(binding.name_) == nullptr) {
        return Error::InvalidArgument(std::format("member bound to unknown field {}.{}",
                                                  schema_->entity_id(), binding.name_));
      }
    }
    for (const auto& binding : related_) {
      bool found = false;
      for (const auto& rel : schema_->relationships()) {
        found = found || rel.target_field_name_ == binding.name_;
      }
      if (!found) {
        return Error::InvalidArgument(std::format("member bound to unknown relationship {}.{}",
                                                  schema_->entity_id(), binding.name_));
      }
    }
    return {};
  }

  Document ToDocument(const T& obj) const {
    Document doc;
    for (const auto& binding : fields_) {
      doc.Set(binding.name_, binding.get_(obj));
    }
    for (const auto& binding : related_) {
      auto children = binding.get_(obj);
      if (!children.empty()) {
        doc.SetRelated(binding.name_, std::move(children));
      }
    }
    return doc;
  }

  Result<T> FromDocument(const Document& doc) const {
    T obj{};
    for (const auto& binding : fields_) {
      const auto* value = doc.Get(binding.name_);
      if (value == nullptr) {
        continue;
      }
      if (auto res = binding.set_(obj, *value); !res) {
        return std::move(res.error()).WithContext("schema", schema_->entity_id());
      }
    }
    for (const auto& binding : related_) {
      const auto* children = doc.Related(binding.name_);
      if (children == nullptr) {
        continue;
      }
      if (auto res = binding.set_(obj, *children); !res) {
        return std::move(res.error()).WithContext("relationship", binding.name_);
      }
    }
    return obj;
  }

  /// Maps the object's own record. Related members are written as separate
  /// records with the child bindings.
  Result<RawRecord> ToRecord(const T& obj, const RecordMapper& mapper) const {
    return mapper.ToRecord(ToDocument(obj), *schema_);
  }

  Result<T> FromRecord(const RawRecord& record, const RecordMapper& mapper) const {
    DYNAMAP_ASSIGN_OR_RETURN(auto doc, mapper.FromRecord(record, *schema_));
    return FromDocument(doc);
  }

  /// Reconstructs one object per partition-key group, related members
  /// populated from child records.
  Result<std::vector<T>> Reconstruct(const std::vector<RawRecord>& records,
                                     const MultiRecordReconstructor& reconstructor) const {
    DYNAMAP_ASSIGN_OR_RETURN(auto reconstruction, reconstructor.Reconstruct(records, *schema_));
    std::vector<T> objects;
    objects.reserve(reconstruction.entities_.size());
    for (const auto& entity : reconstruction.entities_) {
      DYNAMAP_ASSIGN_OR_RETURN(auto obj, FromDocument(entity.document_));
      objects.push_back(std::move(obj));
    }
    return objects;
  }

private:
  struct FieldBinding {
    std::string name_;
    std::function<FieldValue(const T&)> get_;
    std::function<Result<void>(T&, const FieldValue&)> set_;
  };

  struct RelatedBinding {
    std::string name_;
    std::function<std::vector<Document>(const T&)> get_;
    std::function<Result<void>(T&, const std::vector<Document>&)> set_;
  };

  static Error MemberMismatch(const std::string& field, const FieldValue& value,
                              std::string_view member_type) {
    return Error::ConversionError(field, value.ToString(), member_type,
                                  std::format("{} value cannot be assigned to a {} member",
                                              ToString(value.kind()), member_type))
        .WithContext("field", field);
  }

  SchemaModelPtr schema_;
  std::vector<FieldBinding> fields_;
  std::vector<RelatedBinding> related_;
};

} // namespace dynamap
