#include "common/dynamap_test_suite.hpp"
#include "dynamap/schema/field_descriptor.hpp"
#include "dynamap/value/value_codec.hpp"

#include <gtest/gtest.h>

#include <limits>
#include <string>
#include <vector>

namespace dynamap::test {

class ValueCodecTest : public DynamapTestSuite {
protected:
  static void ExpectRoundTrip(const FieldValue& value, const FieldDescriptor& field,
                              AttributeType expected_type) {
    auto node = ValueCodec::Encode(value, field);
    ASSERT_TRUE(node) << node.error().ToString();
    EXPECT_EQ(node.value().type(), expected_type) << node.value().ToString();

    auto decoded = ValueCodec::Decode(node.value(), field);
    ASSERT_TRUE(decoded) << decoded.error().ToString();
    EXPECT_EQ(decoded.value(), value) << decoded.value().ToString() << " vs " << value.ToString();
  }
};

TEST_F(ValueCodecTest, ScalarRoundTrips) {
  ExpectRoundTrip("hello", FieldBuilder("s"), AttributeType::kString);
  ExpectRoundTrip(-42, FieldBuilder("i", ScalarType::kNumber), AttributeType::kNumber);
  ExpectRoundTrip(12.75, FieldBuilder("d", ScalarType::kNumber).Decimal(), AttributeType::kNumber);
  ExpectRoundTrip(true, FieldBuilder("b", ScalarType::kBoolean), AttributeType::kBool);
  ExpectRoundTrip(Binary{0x00, 0x10, 0xfe}, FieldBuilder("bin", ScalarType::kBinary),
                  AttributeType::kBinary);
  ExpectRoundTrip("SHIPPED", FieldBuilder("e", ScalarType::kEnum), AttributeType::kString);
  ExpectRoundTrip(DateTime::Parse("2024-03-01T10:15:30.5+02:00").value(),
                  FieldBuilder("dt", ScalarType::kDateTime), AttributeType::kString);
}

TEST_F(ValueCodecTest, NumbersUseDecimalText) {
  auto node = ValueCodec::Encode(12.5, FieldBuilder("d", ScalarType::kNumber).Decimal());
  ASSERT_TRUE(node);
  EXPECT_EQ(*node.value().AsNumber(), "12.5");

  node = ValueCodec::Encode(3, FieldBuilder("d", ScalarType::kNumber).Decimal().Format("F2"));
  ASSERT_TRUE(node);
  EXPECT_EQ(*node.value().AsNumber(), "3.00");

  node = ValueCodec::Encode(7, FieldBuilder("i", ScalarType::kNumber).Format("D4"));
  ASSERT_TRUE(node);
  EXPECT_EQ(*node.value().AsNumber(), "0007");

  // integer fields accept integral text written with a fixed point format
  auto decoded = ValueCodec::Decode(AttributeValue::Number("3.00"),
                                    FieldBuilder("i", ScalarType::kNumber));
  ASSERT_TRUE(decoded);
  EXPECT_EQ(decoded.value(), FieldValue(3));

  EXPECT_FALSE(
      ValueCodec::Decode(AttributeValue::Number("3.5"), FieldBuilder("i", ScalarType::kNumber)));
  EXPECT_FALSE(ValueCodec::Encode(std::numeric_limits<double>::infinity(),
                                  FieldBuilder("d", ScalarType::kNumber).Decimal()));
}

TEST_F(ValueCodecTest, DateTimeFormatAndZone) {
  FieldDescriptor field = FieldBuilder("dt", ScalarType::kDateTime)
                              .Timezone(TimezonePolicy{.kind_ = TimezoneKind::kUtc})
                              .Format("yyyy-MM-ddTHH:mm:ssK");
  auto dt = DateTime::Parse("2024-03-01T12:00:00+02:00").value();

  auto node = ValueCodec::Encode(dt, field);
  ASSERT_TRUE(node);
  EXPECT_EQ(*node.value().AsString(), "2024-03-01T10:00:00Z");

  auto decoded = ValueCodec::Decode(node.value(), field);
  ASSERT_TRUE(decoded);
  EXPECT_EQ(decoded.value().AsDateTime()->instant(), dt.instant());
  EXPECT_EQ(decoded.value().AsDateTime()->offset_minutes(), 0);
}

TEST_F(ValueCodecTest, DateTimeCustomPatternRoundTrips) {
  FieldDescriptor field = FieldBuilder("dt", ScalarType::kDateTime).Format("MM/dd/yyyy");
  ASSERT_TRUE(ValueCodec::ValidateFormat(field, field.format_));
  auto dt = DateTime::Parse("2024-01-15").value();

  auto node = ValueCodec::Encode(dt, field);
  ASSERT_TRUE(node);
  EXPECT_EQ(*node.value().AsString(), "01/15/2024");

  auto decoded = ValueCodec::Decode(node.value(), field);
  ASSERT_TRUE(decoded) << decoded.error().ToString();
  EXPECT_EQ(*decoded.value().AsDateTime(), dt);

  // key text goes through the same pattern
  auto from_text = ValueCodec::FromText("12/31/1999", field);
  ASSERT_TRUE(from_text) << from_text.error().ToString();
  EXPECT_EQ(*from_text.value().AsDateTime(), DateTime::Parse("1999-12-31").value());

  // ISO text no longer matches a field that declares its own pattern
  auto iso = ValueCodec::Decode(AttributeValue::String("2024-01-15"), field);
  ASSERT_FALSE(iso);
  EXPECT_EQ(iso.error().GetCode(), Error::kConversionError);
}

TEST_F(ValueCodecTest, SetsAndLists) {
  FieldDescriptor tags = FieldBuilder("tags").Collection(CollectionKind::kSet);
  auto node = ValueCodec::Encode(FieldValue::List{"b", "a", "b"}, tags);
  ASSERT_TRUE(node);
  ASSERT_EQ(node.value().type(), AttributeType::kStringSet);
  EXPECT_EQ(*node.value().AsStringSet(), (std::vector<std::string>{"b", "a"}));

  FieldDescriptor scores = FieldBuilder("scores", ScalarType::kNumber).Collection();
  node = ValueCodec::Encode(FieldValue::List{1, 2}, scores);
  ASSERT_TRUE(node);
  EXPECT_EQ(node.value().type(), AttributeType::kNumberSet);

  FieldDescriptor flags =
      FieldBuilder("flags", ScalarType::kBoolean).Collection(CollectionKind::kList);
  ExpectRoundTrip(FieldValue::List{true, false, true}, flags, AttributeType::kList);
}

TEST_F(ValueCodecTest, UnsetAndEmptyEncodeToNull) {
  EXPECT_TRUE(ValueCodec::Encode(FieldValue(), FieldBuilder("s")).value().IsNull());
  EXPECT_TRUE(ValueCodec::Encode(FieldValue::List{}, FieldBuilder("tags").Collection())
                  .value()
                  .IsNull());

  auto decoded = ValueCodec::Decode(AttributeValue::Null(), FieldBuilder("s").Required());
  ASSERT_TRUE(decoded);
  EXPECT_FALSE(decoded.value().IsSet());
}

TEST_F(ValueCodecTest, IncompatibleNodeIsConversionError) {
  auto decoded =
      ValueCodec::Decode(AttributeValue::String("ten"), FieldBuilder("qty", ScalarType::kNumber));
  ASSERT_FALSE(decoded);
  EXPECT_EQ(decoded.error().GetCode(), Error::kConversionError);
  EXPECT_EQ(decoded.error().ContextValue("field"), "qty");
  EXPECT_NE(decoded.error().Message().find("NUMBER"), std::string::npos);

  auto encoded = ValueCodec::Encode(FieldValue("ten"), FieldBuilder("qty", ScalarType::kNumber));
  ASSERT_FALSE(encoded);
  EXPECT_EQ(encoded.error().GetCode(), Error::kConversionError);
}

TEST_F(ValueCodecTest, SensitiveNodesAreRedactedInErrors) {
  auto decoded = ValueCodec::Decode(AttributeValue::String("123-45-6789"),
                                    FieldBuilder("ssn", ScalarType::kNumber).Sensitive());
  ASSERT_FALSE(decoded);
  EXPECT_EQ(decoded.error().Message().find("123-45-6789"), std::string::npos);
  EXPECT_NE(decoded.error().Message().find("[REDACTED]"), std::string::npos);
}

TEST_F(ValueCodecTest, KeyText) {
  FieldDescriptor num = FieldBuilder("n", ScalarType::kNumber);
  EXPECT_EQ(ValueCodec::ToText(42, num).value(), "42");
  EXPECT_EQ(ValueCodec::ToText(42, num, "D5").value(), "00042");
  EXPECT_EQ(ValueCodec::ToText(Binary{0xab}, FieldBuilder("b", ScalarType::kBinary)).value(), "ab");
  EXPECT_FALSE(ValueCodec::ToText("x", FieldBuilder("s"), "F2"));

  EXPECT_EQ(ValueCodec::FromText("00042", num).value(), FieldValue(42));
  EXPECT_EQ(ValueCodec::FromText("true", FieldBuilder("b", ScalarType::kBoolean)).value(),
            FieldValue(true));
  EXPECT_FALSE(ValueCodec::FromText("abc", num));
}

TEST_F(ValueCodecTest, ValidateFormat) {
  EXPECT_TRUE(ValueCodec::ValidateFormat(FieldBuilder("n", ScalarType::kNumber), "F3"));
  EXPECT_FALSE(ValueCodec::ValidateFormat(FieldBuilder("n", ScalarType::kNumber), "X2"));
  EXPECT_TRUE(ValueCodec::ValidateFormat(FieldBuilder("dt", ScalarType::kDateTime), "yyyy-MM-dd"));
  EXPECT_FALSE(ValueCodec::ValidateFormat(FieldBuilder("dt", ScalarType::kDateTime), "yyy"));
  EXPECT_TRUE(ValueCodec::ValidateFormat(FieldBuilder("dt", ScalarType::kDateTime), "M/d/yyyy"));
  // "1" + "25" renders as "125", which reads back as month 12
  EXPECT_FALSE(ValueCodec::ValidateFormat(FieldBuilder("dt", ScalarType::kDateTime), "Mdd"));
  EXPECT_FALSE(ValueCodec::ValidateFormat(FieldBuilder("s"), "F2"));
}

} // namespace dynamap::test
