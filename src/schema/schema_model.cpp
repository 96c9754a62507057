#include "dynamap/schema/schema_model.hpp"

namespace dynamap {

const FieldDescriptor* SchemaModel::FindField(std::string_view source_name) const {
  for (const auto& field : fields_) {
    if (field.source_name_ == source_name) {
      return &field;
    }
  }
  return nullptr;
}

const FieldDescriptor* SchemaModel::FindByStoredName(std::string_view stored_name) const {
  for (const auto& field : fields_) {
    if (field.IsStored() && field.stored_name_ == stored_name) {
      return &field;
    }
  }
  return nullptr;
}

} // namespace dynamap
