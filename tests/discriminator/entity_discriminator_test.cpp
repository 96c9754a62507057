#include "common/dynamap_test_suite.hpp"
#include "dynamap/discriminator/entity_discriminator.hpp"

#include <gtest/gtest.h>

#include <initializer_list>
#include <string>
#include <utility>
#include <vector>

namespace dynamap::test {

class EntityDiscriminatorTest : public DynamapTestSuite {
protected:
  /// Shape of "orders" with only a partition key, a sort key and a required
  /// sku, recognized by the given rule.
  static SchemaModelPtr Shape(const std::string& entity_id, DiscriminatorRule rule) {
    EntityDefinition def;
    def.entity_id_ = entity_id;
    def.table_name_ = "orders";
    def.fields_ = {
        FieldBuilder("pk").PartitionKey(),
        FieldBuilder("sk").SortKey(),
        FieldBuilder("sku").Required(),
    };
    def.discriminator_ = std::move(rule);
    return MustBuild(def);
  }

  using Attributes = std::initializer_list<std::pair<const std::string, AttributeValue>>;

  static RawRecord Record(Attributes attrs) {
    RawRecord record{{"pk", AttributeValue::String("T1#C1")}};
    for (const auto& [name, value] : attrs) {
      record.insert_or_assign(name, value);
    }
    return record;
  }
};

TEST_F(EntityDiscriminatorTest, AttributeDecidesWhenPresent) {
  auto order = Shape("Order", DiscriminatorRule{.attribute_name_ = "type",
                                                .attribute_value_ = "ORDER",
                                                .sort_key_pattern_ = "META"});
  ASSERT_NE(order, nullptr);

  auto tagged = Record({{"type", AttributeValue::String("ORDER")},
                        {"sk", AttributeValue::String("LINE#1")}});
  EXPECT_EQ(EntityDiscriminator::Evaluate(tagged, *order), MatchRank::kAttribute);

  // a carried attribute that does not match is final, the sort key is not
  // consulted
  auto mistagged = Record({{"type", AttributeValue::String("LINE")},
                           {"sk", AttributeValue::String("META")}});
  EXPECT_EQ(EntityDiscriminator::Evaluate(mistagged, *order), MatchRank::kNone);

  auto untagged = Record({{"sk", AttributeValue::String("META")}});
  EXPECT_EQ(EntityDiscriminator::Evaluate(untagged, *order), MatchRank::kSortKey);

  auto neither = Record({{"sk", AttributeValue::String("LINE#1")}});
  EXPECT_FALSE(EntityDiscriminator::Matches(neither, *order));
}

TEST_F(EntityDiscriminatorTest, AttributeOnlyShapeNeedsTheAttribute) {
  auto order = Shape("Order", DiscriminatorRule{.attribute_name_ = "type",
                                                .attribute_pattern_ = "ORDER*"});
  ASSERT_NE(order, nullptr);

  EXPECT_TRUE(EntityDiscriminator::Matches(
      Record({{"type", AttributeValue::String("ORDER_V2")}, {"sku", AttributeValue::String("A")}}),
      *order));
  EXPECT_FALSE(
      EntityDiscriminator::Matches(Record({{"sku", AttributeValue::String("A")}}), *order));

  // only S, N and B attributes carry discriminator text
  EXPECT_FALSE(
      EntityDiscriminator::Matches(Record({{"type", AttributeValue::Bool(true)}}), *order));
}

TEST_F(EntityDiscriminatorTest, PresenceNeedsRequiredAttributes) {
  auto line = Shape("OrderLine", DiscriminatorRule{});
  ASSERT_NE(line, nullptr);

  auto complete =
      Record({{"sk", AttributeValue::String("LINE#1")}, {"sku", AttributeValue::String("A")}});
  EXPECT_EQ(EntityDiscriminator::Evaluate(complete, *line), MatchRank::kPresence);

  auto missing_sku = Record({{"sk", AttributeValue::String("LINE#1")}});
  EXPECT_EQ(EntityDiscriminator::Evaluate(missing_sku, *line), MatchRank::kNone);

  auto null_sku =
      Record({{"sk", AttributeValue::String("LINE#1")}, {"sku", AttributeValue::Null()}});
  EXPECT_EQ(EntityDiscriminator::Evaluate(null_sku, *line), MatchRank::kNone);
}

TEST_F(EntityDiscriminatorTest, ClassifyPrefersTheStrongestRule) {
  auto by_presence = Shape("Any", DiscriminatorRule{});
  auto by_sort_key = Shape("Line", DiscriminatorRule{.sort_key_pattern_ = "LINE#*"});
  auto by_attribute = Shape("Tagged", DiscriminatorRule{.attribute_name_ = "type",
                                                        .attribute_value_ = "LINE"});
  ASSERT_NE(by_presence, nullptr);
  ASSERT_NE(by_sort_key, nullptr);
  ASSERT_NE(by_attribute, nullptr);
  std::vector<SchemaModelPtr> shapes{by_presence, by_sort_key, by_attribute};

  EntityDiscriminator discriminator;
  auto record = Record({{"sk", AttributeValue::String("LINE#1")},
                        {"sku", AttributeValue::String("A")},
                        {"type", AttributeValue::String("LINE")}});
  auto result = discriminator.Classify(record, shapes);
  EXPECT_EQ(result.index_, 2);
  EXPECT_EQ(result.rank_, MatchRank::kAttribute);
  EXPECT_FALSE(result.Ambiguous());
  EXPECT_TRUE(result.warning_.empty());

  record.erase("type");
  result = discriminator.Classify(record, shapes);
  EXPECT_EQ(result.index_, 1);
  EXPECT_EQ(result.rank_, MatchRank::kSortKey);

  record.insert_or_assign("sk", AttributeValue::String("NOTE#1"));
  result = discriminator.Classify(record, shapes);
  EXPECT_EQ(result.index_, 0);
  EXPECT_EQ(result.rank_, MatchRank::kPresence);

  record.erase("sku");
  result = discriminator.Classify(record, shapes);
  EXPECT_FALSE(result.Matched());
  EXPECT_EQ(result.rank_, MatchRank::kNone);
}

TEST_F(EntityDiscriminatorTest, ClassifyTiesGoToTheFirstShape) {
  auto first = Shape("First", DiscriminatorRule{.sort_key_pattern_ = "LINE#*"});
  auto second = Shape("Second", DiscriminatorRule{.sort_key_pattern_ = "*#1"});
  ASSERT_NE(first, nullptr);
  ASSERT_NE(second, nullptr);

  MapperOption option;
  option.warn_on_ambiguous_shapes_ = false;
  auto result = EntityDiscriminator(option).Classify(
      Record({{"sk", AttributeValue::String("LINE#1")}, {"sku", AttributeValue::String("A")}}),
      {first, second});
  EXPECT_EQ(result.index_, 0);
  EXPECT_TRUE(result.Ambiguous());
  EXPECT_EQ(result.matches_, (std::vector<std::string>{"First", "Second"}));
  EXPECT_NE(result.warning_.find("First"), std::string::npos);
  EXPECT_NE(result.warning_.find("Second"), std::string::npos);
}

} // namespace dynamap::test
