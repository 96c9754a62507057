#include "common/dynamap_test_suite.hpp"
#include "dynamap/mapper/document.hpp"
#include "dynamap/value/attribute_value.hpp"
#include "dynamap/value/field_value.hpp"

#include <gtest/gtest.h>

#include <memory>
#include <string>

namespace dynamap::test {

class AttributeValueTest : public DynamapTestSuite {};

TEST_F(AttributeValueTest, ExactlyOneVariant) {
  auto s = AttributeValue::String("abc");
  EXPECT_EQ(s.type(), AttributeType::kString);
  ASSERT_NE(s.AsString(), nullptr);
  EXPECT_EQ(s.AsNumber(), nullptr);

  // S and N share a representation but stay distinct variants
  auto n = AttributeValue::Number("abc");
  EXPECT_EQ(n.type(), AttributeType::kNumber);
  EXPECT_NE(s, n);

  AttributeValue null;
  EXPECT_TRUE(null.IsNull());
  EXPECT_EQ(null, AttributeValue::Null());
}

TEST_F(AttributeValueTest, KeyText) {
  EXPECT_EQ(AttributeValue::String("T1#C1").KeyText(), "T1#C1");
  EXPECT_EQ(AttributeValue::Number("42").KeyText(), "42");
  EXPECT_EQ(AttributeValue::Bytes({0x0a, 0xff}).KeyText(), "0aff");
  EXPECT_EQ(AttributeValue::Bool(true).KeyText(), "");
}

TEST_F(AttributeValueTest, Render) {
  EXPECT_EQ(AttributeValue::String("a\"b").ToString(), R"({"S":"a\"b"})");
  EXPECT_EQ(AttributeValue::NumberSet({"1", "2"}).ToString(), R"({"NS":["1","2"]})");
  EXPECT_EQ(AttributeValue::Bool(false).ToString(), R"({"BOOL":false})");
  EXPECT_EQ(AttributeValue::Null().ToString(), R"({"NULL":true})");
  EXPECT_EQ(AttributeValue::List({AttributeValue::Number("1"), AttributeValue::String("x")})
                .ToString(),
            R"({"L":[{"N":"1"},{"S":"x"}]})");
  EXPECT_EQ(AttributeValue::Map({{"k", AttributeValue::String("v")}}).ToString(),
            R"({"M":{"k":{"S":"v"}}})");
}

TEST_F(AttributeValueTest, RenderRecordRedactsNames) {
  RawRecord record{
      {"pk", AttributeValue::String("T1")},
      {"ssn", AttributeValue::String("123-45-6789")},
  };
  EXPECT_EQ(ToString(record), R"({"pk":{"S":"T1"},"ssn":{"S":"123-45-6789"}})");
  EXPECT_EQ(ToString(record, {"ssn"}), R"({"pk":{"S":"T1"},"ssn":"[REDACTED]"})");
}

TEST_F(AttributeValueTest, FieldValueKinds) {
  EXPECT_EQ(FieldValue().kind(), ValueKind::kUnset);
  EXPECT_EQ(FieldValue(true).kind(), ValueKind::kBool);
  EXPECT_EQ(FieldValue(7).kind(), ValueKind::kInteger);
  EXPECT_EQ(FieldValue(uint16_t{7}).kind(), ValueKind::kInteger);
  EXPECT_EQ(FieldValue(1.5).kind(), ValueKind::kDecimal);
  EXPECT_EQ(FieldValue("x").kind(), ValueKind::kString);
  EXPECT_EQ(FieldValue(Binary{1}).kind(), ValueKind::kBinary);
  EXPECT_EQ(FieldValue(FieldValue::List{1, 2}).kind(), ValueKind::kList);

  EXPECT_EQ(FieldValue(7), FieldValue(int64_t{7}));
  EXPECT_NE(FieldValue(7), FieldValue(7.0));
  EXPECT_EQ(FieldValue(FieldValue::List{1, "a"}).ToString(), "[1, \"a\"]");
}

TEST_F(AttributeValueTest, NestedDocumentsCompareByContent) {
  auto a = std::make_shared<Document>();
  a->Set("city", "Berlin");
  auto b = std::make_shared<Document>();
  b->Set("city", "Berlin");

  EXPECT_EQ(FieldValue(FieldValue::DocumentPtr(a)), FieldValue(FieldValue::DocumentPtr(b)));
  b->Set("zip", "10115");
  EXPECT_NE(FieldValue(FieldValue::DocumentPtr(a)), FieldValue(FieldValue::DocumentPtr(b)));
}

} // namespace dynamap::test
