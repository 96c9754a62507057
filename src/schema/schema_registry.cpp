#include "dynamap/schema/schema_registry.hpp"

#include "dynamap/base/log.hpp"

#include <format>
namespace dynamap {

std::shared_ptr<SchemaRegistry::Entry> SchemaRegistry::EntryOf(const std::string& entity_id,
                                                               bool* created) {
  {
    DYNAMAP_SHARED_LOCK(mutex_);
    auto it = entries_.find(entity_id);
    if (it != entries_.end()) {
      if (created != nullptr) {
        *created = false;
      }
      return it->second;
    }
  }

  DYNAMAP_UNIQUE_LOCK(mutex_);
  auto [it, inserted] = entries_.try_emplace(entity_id, nullptr);
  if (inserted) {
    it->second = std::make_shared<Entry>();
  }
  if (created != nullptr) {
    *created = inserted;
  }
  return it->second;
}

Result<SchemaModelPtr> SchemaRegistry::GetOrBuild(const std::string& entity_id,
                                                  const std::function<EntityDefinition()>& define) {
  auto entry = EntryOf(entity_id, nullptr);
  std::call_once(entry->once_, [&]() {
    auto definition = define();
    if (definition.entity_id_ != entity_id) {
      entry->error_ = Error::InvalidArgument(
          std::format("definition of {} declares entity id {}", entity_id, definition.entity_id_));
      return;
    }
    auto model = builder_.Build(definition);
    if (!model) {
      entry->error_ = std::move(model.error());
      return;
    }
    if (auto res = Admit(*entry, model.value()); !res) {
      entry->error_ = std::move(res.error());
    }
  });
  return Outcome(*entry);
}

Result<SchemaModelPtr> SchemaRegistry::Register(const EntityDefinition& definition) {
  bool created = false;
  EntryOf(definition.entity_id_, &created);
  if (!created) {
    return Error::InvalidArgument(
        std::format("entity {} is already registered", definition.entity_id_));
  }
  return GetOrBuild(definition.entity_id_, [&]() { return definition; });
}

Result<std::vector<SchemaModelPtr>> SchemaRegistry::RegisterAll(
    std::vector<EntityDefinition> definitions) {
  DYNAMAP_ASSIGN_OR_RETURN(auto models, builder_.BuildAll(std::move(definitions)));

  // all or nothing, nothing is published before every shape passed
  DYNAMAP_UNIQUE_LOCK(mutex_);
  for (const auto& model : models) {
    if (entries_.contains(model->entity_id())) {
      return Error::InvalidArgument(
          std::format("entity {} is already registered", model->entity_id()));
    }
  }
  std::vector<SchemaModelPtr> pending;
  for (const auto& model : models) {
    DYNAMAP_RETURN_IF_ERROR(CheckTable(model, pending));
    pending.push_back(model);
  }

  for (const auto& model : models) {
    auto entry = std::make_shared<Entry>();
    std::call_once(entry->once_, [&]() { Publish(*entry, model); });
    entries_.emplace(model->entity_id(), std::move(entry));
  }
  return models;
}

SchemaModelPtr SchemaRegistry::Get(std::string_view entity_id) const {
  DYNAMAP_SHARED_LOCK(mutex_);
  auto it = entries_.find(std::string(entity_id));
  if (it == entries_.end()) {
    return nullptr;
  }
  return it->second->model_;
}

Result<SchemaModelPtr> SchemaRegistry::Require(std::string_view entity_id) const {
  auto model = Get(entity_id);
  if (model == nullptr) {
    return Error::SchemaNotFound(entity_id);
  }
  return model;
}

std::vector<SchemaModelPtr> SchemaRegistry::ShapesForTable(std::string_view table_name) const {
  DYNAMAP_SHARED_LOCK(mutex_);
  std::vector<SchemaModelPtr> shapes;
  for (const auto& model : admitted_) {
    if (!model->nested() && model->table_name() == table_name) {
      shapes.push_back(model);
    }
  }
  return shapes;
}

size_t SchemaRegistry::Size() const {
  DYNAMAP_SHARED_LOCK(mutex_);
  return admitted_.size();
}

Result<void> SchemaRegistry::Admit(Entry& entry, const SchemaModelPtr& model) {
  DYNAMAP_UNIQUE_LOCK(mutex_);
  DYNAMAP_RETURN_IF_ERROR(CheckTable(model, {}));
  Publish(entry, model);
  return {};
}

Result<void> SchemaRegistry::CheckTable(const SchemaModelPtr& model,
                                        const std::vector<SchemaModelPtr>& pending) const {
  if (model->nested()) {
    return {};
  }

  std::vector<SchemaModelPtr> shapes;
  for (const auto* group : {&admitted_, &pending}) {
    for (const auto& other : *group) {
      if (!other->nested() && other->table_name() == model->table_name()) {
        shapes.push_back(other);
      }
    }
  }
  shapes.push_back(model);

  Diagnostics conflicts;
  for (auto& diag : SchemaBuilder::CheckTableShapes(shapes)) {
    if (diag.field_path_ == model->entity_id()) {
      conflicts.push_back(std::move(diag));
    }
  }
  if (conflicts.empty()) {
    return {};
  }
  auto err =
      Error::SchemaBuildFailed(model->entity_id(), conflicts.size(), conflicts.front().ToString());
  for (const auto& diag : conflicts) {
    err.WithContext("diagnostic", diag.ToString());
  }
  return err;
}

void SchemaRegistry::Publish(Entry& entry, const SchemaModelPtr& model) {
  admitted_.push_back(model);
  entry.model_ = model;
  Log::Info("Schema registered, entity={}, table={}", model->entity_id(), model->table_name());
}

Result<SchemaModelPtr> SchemaRegistry::Outcome(const Entry& entry) {
  if (entry.error_) {
    return *entry.error_;
  }
  return entry.model_;
}

} // namespace dynamap
