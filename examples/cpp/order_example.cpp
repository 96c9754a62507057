#include <dynamap/base/log.hpp>
#include <dynamap/mapper/record_mapper.hpp>
#include <dynamap/mapper_option.hpp>
#include <dynamap/reconstruct/multi_record_reconstructor.hpp>
#include <dynamap/schema/schema_registry.hpp>

#include <iostream>
#include <vector>

using dynamap::AttributeValue;
using dynamap::Document;
using dynamap::EntityDefinition;
using dynamap::FieldBuilder;
using dynamap::RawRecord;
using dynamap::ScalarType;

namespace {

EntityDefinition OrderLineDefinition() {
  EntityDefinition def;
  def.entity_id_ = "OrderLine";
  def.table_name_ = "orders";
  def.fields_ = {
      FieldBuilder("pk").PartitionKey(),
      FieldBuilder("sk").SortKey(),
      FieldBuilder("sku").Required(),
      FieldBuilder("qty", ScalarType::kNumber),
  };
  def.discriminator_.sort_key_pattern_ = "LINE#*";
  return def;
}

EntityDefinition OrderDefinition() {
  EntityDefinition def;
  def.entity_id_ = "Order";
  def.table_name_ = "orders";
  def.fields_ = {
      FieldBuilder("tenant_id").Required(),
      FieldBuilder("order_id").Required(),
      FieldBuilder("pk").PartitionKey().DerivedFromTemplate({"tenant_id", "order_id"},
                                                            "TENANT#{0}#ORDER#{1}"),
      FieldBuilder("sk").SortKey(),
      FieldBuilder("total", ScalarType::kNumber).Decimal().Format("F2"),
  };
  def.relationships_.push_back(dynamap::RelationshipDescriptor{
      .target_field_name_ = "lines",
      .sort_key_pattern_ = "LINE#*",
      .target_entity_id_ = "OrderLine",
  });
  def.discriminator_.sort_key_pattern_ = "META";
  return def;
}

} // namespace

int main() {
  // init logging
  dynamap::MapperOption option;
  option.log_level_ = dynamap::LogLevel::kInfo;
  dynamap::Log::Init(option);

  // register shapes
  dynamap::SchemaRegistry registry(option);
  auto shapes = registry.RegisterAll({OrderDefinition(), OrderLineDefinition()});
  if (!shapes) {
    std::cerr << "register shapes failed: " << shapes.error().ToString() << std::endl;
    return 1;
  }
  auto order_schema = registry.Require("Order").value();

  // write an order
  dynamap::RecordMapper mapper(option);
  Document order;
  order.Set("tenant_id", "acme");
  order.Set("order_id", "1001");
  order.Set("sk", "META");
  order.Set("total", 42.5);
  auto meta = mapper.ToRecord(order, *order_schema);
  if (!meta) {
    std::cerr << "map order failed: " << meta.error().ToString() << std::endl;
    return 1;
  }
  std::cout << "order record: " << mapper.RenderRecord(meta.value(), *order_schema) << std::endl;

  // read it back together with its lines
  const auto& pk = meta.value().at("pk");
  std::vector<RawRecord> records{
      meta.value(),
      {{"pk", pk}, {"sk", AttributeValue::String("LINE#1")},
       {"sku", AttributeValue::String("KB-01")}, {"qty", AttributeValue::Number("2")}},
      {{"pk", pk}, {"sk", AttributeValue::String("LINE#2")},
       {"sku", AttributeValue::String("MS-07")}, {"qty", AttributeValue::Number("1")}},
  };
  dynamap::MultiRecordReconstructor reconstructor(mapper);
  auto res = reconstructor.Reconstruct(records, *order_schema);
  if (!res) {
    std::cerr << "reconstruct failed: " << res.error().ToString() << std::endl;
    return 1;
  }
  for (const auto& entity : res.value().entities_) {
    std::cout << entity.partition_key_ << ", " << entity.child_records_ << " lines" << std::endl;
    for (const auto& line : *entity.document_.Related("lines")) {
      std::cout << "  " << line.Get("sku")->ToString() << " x " << line.Get("qty")->ToString()
                << std::endl;
    }
  }

  dynamap::Log::Deinit();
  return 0;
}
