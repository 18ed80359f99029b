#include "stagehand/scheduler/parallelism.hpp"

#include "gtest/gtest.h"

#include <string>

using namespace stagehand;

TEST(ParallelismTest, ParsesPositiveCount) {
  auto p = Parallelism::parse("4");
  ASSERT_TRUE(p.has_value());
  EXPECT_FALSE(p->is_unbounded());
  EXPECT_EQ(p->limit(), 4);
  EXPECT_EQ(p->to_string(), "4");
}

TEST(ParallelismTest, MaxAndAllAreUnboundedInAnyCase) {
  for (const char *text : {"max", "MAX", "Max", "mAx", "all", "ALL"}) {
    auto p = Parallelism::parse(text);
    ASSERT_TRUE(p.has_value()) << text;
    EXPECT_TRUE(p->is_unbounded()) << text;
    EXPECT_EQ(p->to_string(), "max");
  }
}

TEST(ParallelismTest, RejectsNonNumericText) {
  auto p = Parallelism::parse("tequila");
  ASSERT_FALSE(p.has_value());
  EXPECT_EQ(p.error(), Error::InvalidParallelism);
  EXPECT_NE(p.error().message().find("tequila"), std::string::npos);
}

TEST(ParallelismTest, RejectsZeroNegativeAndDecorated) {
  for (const char *text : {"0", "-2", "", "3x", " 3", "m-a-x", "max ", "a_ll", "1.5"}) {
    auto p = Parallelism::parse(text);
    EXPECT_FALSE(p.has_value()) << "'" << text << "'";
  }
}

TEST(ParallelismTest, RejectsOverflow) {
  EXPECT_FALSE(Parallelism::parse("99999999999999999999999").has_value());
}

TEST(ParallelismTest, FromSettingAcceptsBothSpellings) {
  auto count = Parallelism::from_setting(ParallelismSetting{3});
  ASSERT_TRUE(count.has_value());
  EXPECT_EQ(count->limit(), 3);

  auto text = Parallelism::from_setting(ParallelismSetting{std::string{"max"}});
  ASSERT_TRUE(text.has_value());
  EXPECT_EQ(*text, Parallelism::unbounded());

  auto bad = Parallelism::from_setting(ParallelismSetting{0});
  ASSERT_FALSE(bad.has_value());
  EXPECT_EQ(bad.error(), Error::InvalidParallelism);
}
