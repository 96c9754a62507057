#pragma once

#include "dynamap/schema/diagnostic.hpp"
#include "dynamap/schema/schema_builder.hpp"
#include "dynamap/schema/schema_model.hpp"
#include "dynamap/value/attribute_value.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <format>
#include <string>
#include <utility>
#include <vector>

namespace dynamap::test {

class DynamapTestSuite : public ::testing::Test {
protected:
  DynamapTestSuite() = default;
  ~DynamapTestSuite() override = default;

  std::string TestName() const {
    auto* cur_test = ::testing::UnitTest::GetInstance()->current_test_info();
    return cur_test->test_suite_name();
  }

  std::string CaseName() const {
    auto* cur_test = ::testing::UnitTest::GetInstance()->current_test_info();
    return cur_test->name();
  }

  /// Builds a shape, reporting the build error as a test failure. Returns
  /// nullptr on failure.
  static SchemaModelPtr MustBuild(const EntityDefinition& def) {
    auto res = SchemaBuilder().Build(def);
    EXPECT_TRUE(res) << res.error().ToString();
    return res ? res.value() : nullptr;
  }

  static bool HasDiagnostic(const Diagnostics& diagnostics, DiagnosticCode code) {
    return std::any_of(diagnostics.begin(), diagnostics.end(),
                       [code](const Diagnostic& d) { return d.code_ == code; });
  }

  //----------------------------------------------------------------------------
  // An order stored as one META record plus one LINE#<n> record per line,
  // all sharing the partition key "<tenant>#<customer>".
  //----------------------------------------------------------------------------

  static EntityDefinition OrderLineDefinition() {
    EntityDefinition def;
    def.entity_id_ = "OrderLine";
    def.table_name_ = "orders";
    def.fields_ = {
        FieldBuilder("pk").PartitionKey(),
        FieldBuilder("sk").SortKey(),
        FieldBuilder("sku").Required(),
        FieldBuilder("qty", ScalarType::kNumber),
        FieldBuilder("price", ScalarType::kNumber).Decimal(),
    };
    def.discriminator_.sort_key_pattern_ = "LINE#*";
    return def;
  }

  static EntityDefinition OrderDefinition(SchemaModelPtr line) {
    EntityDefinition def;
    def.entity_id_ = "Order";
    def.table_name_ = "orders";
    def.fields_ = {
        FieldBuilder("tenant_id"),
        FieldBuilder("customer_id"),
        FieldBuilder("pk").PartitionKey().DerivedFrom({"tenant_id", "customer_id"}),
        FieldBuilder("sk").SortKey(),
        FieldBuilder("total", ScalarType::kNumber).Decimal(),
        FieldBuilder("note"),
    };
    def.relationships_.push_back(RelationshipDescriptor{
        .target_field_name_ = "lines",
        .sort_key_pattern_ = "LINE#*",
        .target_ = std::move(line),
    });
    def.discriminator_.sort_key_pattern_ = "META";
    return def;
  }

  static RawRecord MetaRecord(const std::string& pk, double total) {
    return RawRecord{
        {"pk", AttributeValue::String(pk)},
        {"sk", AttributeValue::String("META")},
        {"total", AttributeValue::Number(std::format("{}", total))},
    };
  }

  static RawRecord LineRecord(const std::string& pk, int line, const std::string& sku) {
    return RawRecord{
        {"pk", AttributeValue::String(pk)},
        {"sk", AttributeValue::String(std::format("LINE#{}", line))},
        {"sku", AttributeValue::String(sku)},
        {"qty", AttributeValue::Number(std::format("{}", line))},
    };
  }
};

} // namespace dynamap::test
