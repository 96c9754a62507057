#include "common/dynamap_test_suite.hpp"
#include "dynamap/schema/schema_registry.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <string>
#include <thread>
#include <vector>

namespace dynamap::test {

class SchemaRegistryTest : public DynamapTestSuite {
protected:
  SchemaRegistry registry_;
};

TEST_F(SchemaRegistryTest, GetOrBuildMemoizes) {
  int calls = 0;
  auto define = [&]() {
    ++calls;
    return OrderLineDefinition();
  };

  auto first = registry_.GetOrBuild("OrderLine", define);
  ASSERT_TRUE(first) << first.error().ToString();
  auto second = registry_.GetOrBuild("OrderLine", define);
  ASSERT_TRUE(second);

  EXPECT_EQ(calls, 1);
  EXPECT_EQ(first.value(), second.value());
  EXPECT_EQ(registry_.Get("OrderLine"), first.value());
  EXPECT_EQ(registry_.Size(), 1u);
}

TEST_F(SchemaRegistryTest, ConcurrentFirstUseBuildsOnce) {
  static constexpr int kThreads = 8;
  std::atomic<int> calls = 0;
  std::vector<SchemaModelPtr> seen(kThreads);

  std::vector<std::thread> threads;
  for (int i = 0; i < kThreads; ++i) {
    threads.emplace_back([&, i]() {
      auto res = registry_.GetOrBuild("OrderLine", [&]() {
        calls.fetch_add(1);
        return OrderLineDefinition();
      });
      if (res) {
        seen[i] = res.value();
      }
    });
  }
  for (auto& t : threads) {
    t.join();
  }

  EXPECT_EQ(calls.load(), 1);
  ASSERT_NE(seen[0], nullptr);
  for (const auto& model : seen) {
    EXPECT_EQ(model, seen[0]);
  }
}

TEST_F(SchemaRegistryTest, FailedBuildIsRemembered) {
  int calls = 0;
  auto define = [&]() {
    ++calls;
    auto def = OrderLineDefinition();
    def.fields_.push_back(FieldBuilder("a").DerivedFrom({"a"}));
    return def;
  };

  auto first = registry_.GetOrBuild("OrderLine", define);
  ASSERT_FALSE(first);
  EXPECT_EQ(first.error().GetCode(), Error::kSchemaBuildFailed);

  auto second = registry_.GetOrBuild("OrderLine", define);
  ASSERT_FALSE(second);
  EXPECT_EQ(second.error(), first.error());
  EXPECT_EQ(calls, 1);
  EXPECT_EQ(registry_.Get("OrderLine"), nullptr);
}

TEST_F(SchemaRegistryTest, DefinitionMustCarryTheRequestedId) {
  auto res = registry_.GetOrBuild("Line", []() { return OrderLineDefinition(); });
  ASSERT_FALSE(res);
  EXPECT_EQ(res.error().GetCode(), Error::kInvalidArgument);
}

TEST_F(SchemaRegistryTest, RegisterRejectsTakenIds) {
  ASSERT_TRUE(registry_.Register(OrderLineDefinition()));
  auto res = registry_.Register(OrderLineDefinition());
  ASSERT_FALSE(res);
  EXPECT_EQ(res.error().GetCode(), Error::kInvalidArgument);
}

TEST_F(SchemaRegistryTest, RequireUnknownShape) {
  auto res = registry_.Require("Invoice");
  ASSERT_FALSE(res);
  EXPECT_EQ(res.error().GetCode(), Error::kSchemaNotFound);
  EXPECT_NE(res.error().Message().find("Invoice"), std::string::npos);
}

TEST_F(SchemaRegistryTest, ShapesOfOneTableMustBeDistinguishable) {
  auto line = registry_.Register(OrderLineDefinition());
  ASSERT_TRUE(line);
  auto order = registry_.Register(OrderDefinition(line.value()));
  ASSERT_TRUE(order) << order.error().ToString();
  EXPECT_EQ(registry_.ShapesForTable("orders"),
            (std::vector<SchemaModelPtr>{line.value(), order.value()}));

  // a second line shape claims the same sort keys
  auto clash = OrderLineDefinition();
  clash.entity_id_ = "ReturnLine";
  auto res = registry_.Register(clash);
  ASSERT_FALSE(res);
  EXPECT_EQ(res.error().GetCode(), Error::kSchemaBuildFailed);
  auto diagnostic = res.error().ContextValue("diagnostic");
  ASSERT_TRUE(diagnostic.has_value());
  EXPECT_NE(diagnostic->find("ConflictingEntityShapes"), std::string::npos);

  EXPECT_EQ(registry_.Get("ReturnLine"), nullptr);
  EXPECT_EQ(registry_.ShapesForTable("orders").size(), 2u);
  EXPECT_TRUE(registry_.ShapesForTable("invoices").empty());
}

TEST_F(SchemaRegistryTest, RegisterAllResolvesReferences) {
  auto order = OrderDefinition(nullptr);
  order.relationships_[0].target_entity_id_ = "OrderLine";

  auto res = registry_.RegisterAll({order, OrderLineDefinition()});
  ASSERT_TRUE(res) << res.error().ToString();
  ASSERT_EQ(res.value().size(), 2u);
  EXPECT_EQ(registry_.Require("Order").value(), res.value()[0]);
  EXPECT_EQ(registry_.Require("OrderLine").value(), res.value()[1]);
  EXPECT_EQ(registry_.Require("Order").value()->relationships()[0].target_, res.value()[1]);

  // taken ids fail the whole batch
  EXPECT_FALSE(registry_.RegisterAll({OrderLineDefinition()}));
}

TEST_F(SchemaRegistryTest, RegisterAllIsAllOrNothing) {
  ASSERT_TRUE(registry_.Register(OrderLineDefinition()));

  EntityDefinition invoice;
  invoice.entity_id_ = "Invoice";
  invoice.table_name_ = "invoices";
  invoice.fields_ = {
      FieldBuilder("pk").PartitionKey(),
      FieldBuilder("amount", ScalarType::kNumber),
  };

  // a taken id later in the batch keeps the earlier shapes out
  auto taken = registry_.RegisterAll({invoice, OrderLineDefinition()});
  ASSERT_FALSE(taken);
  EXPECT_EQ(taken.error().GetCode(), Error::kInvalidArgument);
  EXPECT_EQ(registry_.Get("Invoice"), nullptr);
  EXPECT_EQ(registry_.Size(), 1u);

  // so does a shape its table cannot tell apart
  auto clash = OrderLineDefinition();
  clash.entity_id_ = "ReturnLine";
  auto conflict = registry_.RegisterAll({invoice, clash});
  ASSERT_FALSE(conflict);
  EXPECT_EQ(conflict.error().GetCode(), Error::kSchemaBuildFailed);
  EXPECT_EQ(registry_.Get("Invoice"), nullptr);
  EXPECT_EQ(registry_.Get("ReturnLine"), nullptr);
  EXPECT_TRUE(registry_.ShapesForTable("invoices").empty());

  // the ids stay free for a later batch
  auto res = registry_.RegisterAll({invoice});
  ASSERT_TRUE(res) << res.error().ToString();
  EXPECT_EQ(registry_.Require("Invoice").value(), res.value()[0]);
  EXPECT_EQ(registry_.Size(), 2u);
}

} // namespace dynamap::test
