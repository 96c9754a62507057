#pragma once

#include "dynamap/base/lock.hpp"
#include "dynamap/base/result.hpp"
#include "dynamap/mapper_option.hpp"
#include "dynamap/schema/schema_builder.hpp"
#include "dynamap/schema/schema_model.hpp"

#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace dynamap {

/// Thread-safe, memoized lookup of validated shapes by entity id.
///
/// Every entity id is built at most once: concurrent first users of the same
/// id wait for one build and share its outcome, a failed build is remembered
/// and reported again instead of being retried. A shape joins its table only
/// when it can be told apart from the shapes already registered there.
class SchemaRegistry {
public:
  explicit SchemaRegistry(const MapperOption& option = MapperOption{}) : builder_(option) {
  }

  /// Returns the shape of entity_id, building it from define() on first use.
  Result<SchemaModelPtr> GetOrBuild(const std::string& entity_id,
                                    const std::function<EntityDefinition()>& define);

  /// Builds and registers a definition, fails when the id is already taken.
  Result<SchemaModelPtr> Register(const EntityDefinition& definition);

  /// Builds definitions referencing each other by entity id, see
  /// SchemaBuilder::BuildAll(), and registers them in order. Registers
  /// nothing when any id is taken or any shape conflicts with its table.
  Result<std::vector<SchemaModelPtr>> RegisterAll(std::vector<EntityDefinition> definitions);

  /// Returns the shape, nullptr when it is not registered or failed to build.
  SchemaModelPtr Get(std::string_view entity_id) const;

  /// Returns the shape or SchemaNotFound.
  Result<SchemaModelPtr> Require(std::string_view entity_id) const;

  /// Shapes stored in a table, in registration order.
  std::vector<SchemaModelPtr> ShapesForTable(std::string_view table_name) const;

  size_t Size() const;

private:
  struct Entry {
    std::once_flag once_;
    SchemaModelPtr model_;
    std::optional<Error> error_;
  };

  std::shared_ptr<Entry> EntryOf(const std::string& entity_id, bool* created);

  /// Adds a built model to its table after the shape check and publishes it
  /// on the entry.
  Result<void> Admit(Entry& entry, const SchemaModelPtr& model);

  /// Checks a shape against the registered and pending shapes of its table.
  /// Requires mutex_.
  Result<void> CheckTable(const SchemaModelPtr& model,
                          const std::vector<SchemaModelPtr>& pending) const;

  /// Requires mutex_.
  void Publish(Entry& entry, const SchemaModelPtr& model);

  static Result<SchemaModelPtr> Outcome(const Entry& entry);

  SchemaBuilder builder_;
  mutable SharedMutex mutex_;
  std::unordered_map<std::string, std::shared_ptr<Entry>> entries_;
  std::vector<SchemaModelPtr> admitted_;
};

} // namespace dynamap
