#include "common/dynamap_test_suite.hpp"
#include "dynamap/mapper/entity_binding.hpp"

#include <gtest/gtest.h>

#include <cstdint>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace dynamap::test {

enum class LineStatus : uint8_t {
  kOpen = 0,
  kShipped,
};

struct Line {
  std::string pk_;
  std::string sk_;
  std::string sku_;
  int32_t qty_ = 0;
  std::optional<double> price_;
  LineStatus status_ = LineStatus::kOpen;
  std::set<std::string> tags_;
};

struct Order {
  std::string tenant_id_;
  std::string customer_id_;
  std::string pk_;
  std::string sk_;
  double total_ = 0;
  std::optional<std::string> note_;
  std::vector<Line> lines_;
};

} // namespace dynamap::test

namespace dynamap {

template <>
struct EnumTraits<test::LineStatus> {
  static std::string_view ToString(test::LineStatus status) {
    return status == test::LineStatus::kShipped ? "SHIPPED" : "OPEN";
  }

  static std::optional<test::LineStatus> FromString(std::string_view text) {
    if (text == "OPEN") {
      return test::LineStatus::kOpen;
    }
    if (text == "SHIPPED") {
      return test::LineStatus::kShipped;
    }
    return std::nullopt;
  }
};

} // namespace dynamap

namespace dynamap::test {

class EntityBindingTest : public DynamapTestSuite {
protected:
  void SetUp() override {
    auto line_def = OrderLineDefinition();
    line_def.fields_.push_back(FieldBuilder("status", ScalarType::kEnum));
    line_def.fields_.push_back(FieldBuilder("tags").Collection());
    auto line_schema = MustBuild(line_def);
    ASSERT_NE(line_schema, nullptr);
    auto order_schema = MustBuild(OrderDefinition(line_schema));
    ASSERT_NE(order_schema, nullptr);

    auto line = std::make_shared<EntityBinding<Line>>(line_schema);
    line->Field("pk", &Line::pk_)
        .Field("sk", &Line::sk_)
        .Field("sku", &Line::sku_)
        .Field("qty", &Line::qty_)
        .Field("price", &Line::price_)
        .Field("status", &Line::status_)
        .Field("tags", &Line::tags_);
    line_ = line;

    order_ = std::make_unique<EntityBinding<Order>>(order_schema);
    order_->Field("tenant_id", &Order::tenant_id_)
        .Field("customer_id", &Order::customer_id_)
        .Field("pk", &Order::pk_)
        .Field("sk", &Order::sk_)
        .Field("total", &Order::total_)
        .Field("note", &Order::note_)
        .Related("lines", &Order::lines_, line_);
  }

  static Line MakeLine(int32_t n, std::string sku) {
    Line line;
    line.pk_ = "T1#C1";
    line.sk_ = "LINE#" + std::to_string(n);
    line.sku_ = std::move(sku);
    line.qty_ = n;
    line.price_ = 9.5;
    line.status_ = LineStatus::kShipped;
    line.tags_ = {"gift", "fragile"};
    return line;
  }

  std::shared_ptr<const EntityBinding<Line>> line_;
  std::unique_ptr<EntityBinding<Order>> order_;
  RecordMapper mapper_;
};

TEST_F(EntityBindingTest, BindingsMatchTheSchema) {
  EXPECT_TRUE(line_->Validate());
  EXPECT_TRUE(order_->Validate());

  EntityBinding<Order> typo(order_->schema());
  typo.Field("totl", &Order::total_);
  auto res = typo.Validate();
  ASSERT_FALSE(res);
  EXPECT_EQ(res.error().GetCode(), Error::kInvalidArgument);

  EntityBinding<Order> unknown_relationship(order_->schema());
  unknown_relationship.Related("items", &Order::lines_, line_);
  EXPECT_FALSE(unknown_relationship.Validate());
}

TEST_F(EntityBindingTest, TypedRecordRoundTrip) {
  auto line = MakeLine(1, "A-1");
  auto record = line_->ToRecord(line, mapper_);
  ASSERT_TRUE(record) << record.error().ToString();
  EXPECT_EQ(record.value().at("status"), AttributeValue::String("SHIPPED"));
  EXPECT_EQ(record.value().at("tags").type(), AttributeType::kStringSet);
  EXPECT_EQ(record.value().at("price"), AttributeValue::Number("9.5"));

  auto back = line_->FromRecord(record.value(), mapper_);
  ASSERT_TRUE(back) << back.error().ToString();
  EXPECT_EQ(back.value().sku_, "A-1");
  EXPECT_EQ(back.value().qty_, 1);
  EXPECT_EQ(back.value().price_, 9.5);
  EXPECT_EQ(back.value().status_, LineStatus::kShipped);
  EXPECT_EQ(back.value().tags_, (std::set<std::string>{"fragile", "gift"}));
}

TEST_F(EntityBindingTest, OptionalMembersMapToAbsentAttributes) {
  Order order;
  order.tenant_id_ = "T1";
  order.customer_id_ = "C1";
  order.sk_ = "META";
  order.total_ = 4.25;

  auto record = order_->ToRecord(order, mapper_);
  ASSERT_TRUE(record) << record.error().ToString();
  EXPECT_EQ(record.value().at("pk"), AttributeValue::String("T1#C1"));
  EXPECT_FALSE(record.value().contains("note"));

  auto back = order_->FromRecord(record.value(), mapper_);
  ASSERT_TRUE(back);
  EXPECT_EQ(back.value().pk_, "T1#C1");
  EXPECT_FALSE(back.value().note_.has_value());
  EXPECT_DOUBLE_EQ(back.value().total_, 4.25);
}

TEST_F(EntityBindingTest, ReconstructTypedObjects) {
  std::vector<RawRecord> records{MetaRecord("T1#C1", 20)};
  for (int32_t n = 1; n <= 2; ++n) {
    auto record = line_->ToRecord(MakeLine(n, std::format("SKU-{}", n)), mapper_);
    ASSERT_TRUE(record) << record.error().ToString();
    records.push_back(std::move(record.value()));
  }

  MultiRecordReconstructor reconstructor(mapper_);
  auto orders = order_->Reconstruct(records, reconstructor);
  ASSERT_TRUE(orders) << orders.error().ToString();
  ASSERT_EQ(orders.value().size(), 1u);

  const auto& order = orders.value()[0];
  EXPECT_EQ(order.pk_, "T1#C1");
  EXPECT_DOUBLE_EQ(order.total_, 20);
  ASSERT_EQ(order.lines_.size(), 2u);
  EXPECT_EQ(order.lines_[0].sku_, "SKU-1");
  EXPECT_EQ(order.lines_[1].qty_, 2);
  EXPECT_EQ(order.lines_[1].status_, LineStatus::kShipped);
}

TEST_F(EntityBindingTest, MemberKindMismatch) {
  Document doc;
  doc.Set("sku", "A-1");
  doc.Set("qty", "many");
  auto res = line_->FromDocument(doc);
  ASSERT_FALSE(res);
  EXPECT_EQ(res.error().GetCode(), Error::kConversionError);
  EXPECT_EQ(res.error().ContextValue("field"), "qty");

  doc.Set("qty", 1);
  doc.Set("status", "LOST");
  EXPECT_FALSE(line_->FromDocument(doc));

  // out of range for the member type
  doc.Set("status", "OPEN");
  doc.Set("qty", int64_t{1} << 40);
  EXPECT_FALSE(line_->FromDocument(doc));
}

} // namespace dynamap::test
