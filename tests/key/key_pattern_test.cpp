#include "common/dynamap_test_suite.hpp"
#include "dynamap/key/key_pattern.hpp"
#include "dynamap/key/key_template.hpp"

#include <gtest/gtest.h>

namespace dynamap::test {

class KeyPatternTest : public DynamapTestSuite {};

TEST_F(KeyPatternTest, WildcardKinds) {
  EXPECT_EQ(KeyPattern::Wildcard("ORDER").kind(), PatternKind::kExact);
  EXPECT_EQ(KeyPattern::Wildcard("ORDER*").kind(), PatternKind::kPrefix);
  EXPECT_EQ(KeyPattern::Wildcard("*_V2").kind(), PatternKind::kSuffix);
  EXPECT_EQ(KeyPattern::Wildcard("*LINE*").kind(), PatternKind::kContains);
  EXPECT_EQ(KeyPattern::Wildcard("*").kind(), PatternKind::kAny);
  EXPECT_EQ(KeyPattern::Wildcard("ORDER#*#LINE#*").kind(), PatternKind::kGlob);
  EXPECT_TRUE(KeyPattern::Wildcard("").Empty());
}

TEST_F(KeyPatternTest, WildcardMatches) {
  auto prefix = KeyPattern::Wildcard("ORDER*");
  EXPECT_TRUE(prefix.Matches("ORDER"));
  EXPECT_TRUE(prefix.Matches("ORDER_V2"));
  EXPECT_FALSE(prefix.Matches("AN_ORDER"));

  auto suffix = KeyPattern::Wildcard("*_V2");
  EXPECT_TRUE(suffix.Matches("ORDER_V2"));
  EXPECT_FALSE(suffix.Matches("ORDER_V3"));

  auto contains = KeyPattern::Wildcard("*LINE*");
  EXPECT_TRUE(contains.Matches("ORDER_LINE_ITEM"));
  EXPECT_FALSE(contains.Matches("ORDER"));

  auto glob = KeyPattern::Wildcard("ORDER#*#LINE#*");
  EXPECT_TRUE(glob.Matches("ORDER#1#LINE#2"));
  EXPECT_FALSE(glob.Matches("ORDER#1#ITEM#2"));

  EXPECT_FALSE(KeyPattern().Matches(""));
}

TEST_F(KeyPatternTest, SegmentMatches) {
  auto line = KeyPattern::Segment("LINE");
  EXPECT_TRUE(line.Matches("LINE"));
  EXPECT_TRUE(line.Matches("LINE#1"));
  EXPECT_FALSE(line.Matches("LINES"));
  EXPECT_FALSE(line.Matches("LINE1"));

  auto prefix = KeyPattern::Segment("LINE#*");
  EXPECT_EQ(prefix.kind(), PatternKind::kPrefix);
  EXPECT_TRUE(prefix.Matches("LINE#7"));
  EXPECT_FALSE(prefix.Matches("LINE"));

  auto exact = KeyPattern::Exact("A*");
  EXPECT_TRUE(exact.Matches("A*"));
  EXPECT_FALSE(exact.Matches("AB"));
}

TEST_F(KeyPatternTest, Overlaps) {
  EXPECT_TRUE(KeyPattern::Segment("LINE#*").Overlaps(KeyPattern::Segment("LINE#1*")));
  EXPECT_FALSE(KeyPattern::Segment("LINE#*").Overlaps(KeyPattern::Segment("NOTE#*")));
  EXPECT_FALSE(KeyPattern::Wildcard("META").Overlaps(KeyPattern::Wildcard("LINE#*")));
  EXPECT_TRUE(KeyPattern::Wildcard("LINE#1").Overlaps(KeyPattern::Wildcard("LINE#*")));
  EXPECT_FALSE(KeyPattern::Wildcard("ORDER").Overlaps(KeyPattern::Wildcard("LINE")));
  EXPECT_FALSE(KeyPattern::Wildcard("*_V1").Overlaps(KeyPattern::Wildcard("*_V2")));
  EXPECT_FALSE(KeyPattern().Overlaps(KeyPattern::Wildcard("*")));
}

class KeyTemplateTest : public DynamapTestSuite {};

TEST_F(KeyTemplateTest, ParsePlaceholders) {
  auto tmpl = KeyTemplate::Parse("TENANT#{0}#CUSTOMER#{1:D4}", 2);
  ASSERT_TRUE(tmpl) << tmpl.error().ToString();

  const auto& segments = tmpl.value().segments();
  ASSERT_EQ(segments.size(), 2u);
  EXPECT_EQ(segments[0].literal_, "TENANT#");
  EXPECT_EQ(segments[0].source_, 0);
  EXPECT_EQ(segments[0].format_, "");
  EXPECT_EQ(segments[1].literal_, "#CUSTOMER#");
  EXPECT_EQ(segments[1].source_, 1);
  EXPECT_EQ(segments[1].format_, "D4");
}

TEST_F(KeyTemplateTest, TrailingLiteralAndEscapes) {
  auto tmpl = KeyTemplate::Parse("{{{0}}}#END", 1);
  ASSERT_TRUE(tmpl);
  const auto& segments = tmpl.value().segments();
  ASSERT_EQ(segments.size(), 2u);
  EXPECT_EQ(segments[0].literal_, "{");
  EXPECT_EQ(segments[1].literal_, "}#END");
  EXPECT_EQ(segments[1].source_, -1);
}

TEST_F(KeyTemplateTest, RejectMalformed) {
  EXPECT_FALSE(KeyTemplate::Parse("A#{0", 1));
  EXPECT_FALSE(KeyTemplate::Parse("A#0}", 1));
  EXPECT_FALSE(KeyTemplate::Parse("A#{x}", 1));
  EXPECT_FALSE(KeyTemplate::Parse("A#{-1}", 1));
  EXPECT_FALSE(KeyTemplate::Parse("A#{1}", 1));
}

TEST_F(KeyTemplateTest, Join) {
  auto tmpl = KeyTemplate::Join(3, "#");
  const auto& segments = tmpl.segments();
  ASSERT_EQ(segments.size(), 3u);
  EXPECT_EQ(segments[0].literal_, "");
  EXPECT_EQ(segments[1].literal_, "#");
  EXPECT_EQ(segments[2].source_, 2);
}

} // namespace dynamap::test
