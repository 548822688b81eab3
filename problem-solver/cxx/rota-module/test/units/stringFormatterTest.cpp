#include <gtest/gtest.h>

#include "utils/stringFormatter.hpp"

TEST(StringFormatterTest, Trim)
{
  EXPECT_EQ(StringFormatter::Trim("  16-1 \t\n"), "16-1");
  EXPECT_EQ(StringFormatter::Trim("   "), "");
  EXPECT_EQ(StringFormatter::Trim(""), "");
}

TEST(StringFormatterTest, ParseList_DropsEmptyItems)
{
  EXPECT_EQ(StringFormatter::ParseList(" 8-16 ,, 16-1 ,"), (std::vector<std::string>{"8-16", "16-1"}));
  EXPECT_EQ(StringFormatter::Split("a;;b"), (std::vector<std::string>{"a", "b"}));
}

TEST(StringFormatterTest, SplitByWord_IgnoresCase)
{
  EXPECT_EQ(
      StringFormatter::SplitByWord("8-16 or 16-1 OR 20-4", " or "),
      (std::vector<std::string>{"8-16", "16-1", "20-4"}));
  EXPECT_EQ(StringFormatter::SplitByWord("8-16", " or "), std::vector<std::string>{"8-16"});
}

TEST(StringFormatterTest, IsValidUtf8)
{
  EXPECT_TRUE(StringFormatter::IsValidUtf8(""));
  EXPECT_TRUE(StringFormatter::IsValidUtf8("Alice"));
  EXPECT_TRUE(StringFormatter::IsValidUtf8("Шумилов"));
  EXPECT_TRUE(StringFormatter::IsValidUtf8("\xf0\x9f\x8d\xb8"));

  EXPECT_FALSE(StringFormatter::IsValidUtf8("Jos\xe9"));
  EXPECT_FALSE(StringFormatter::IsValidUtf8("\xd0"));
  EXPECT_FALSE(StringFormatter::IsValidUtf8("\xc0\xaf"));
  EXPECT_FALSE(StringFormatter::IsValidUtf8("\xed\xa0\x80"));
  EXPECT_FALSE(StringFormatter::IsValidUtf8("\xff"));
}

TEST(StringFormatterTest, Case)
{
  EXPECT_EQ(StringFormatter::ToLower("Doesn't WORK"), "doesn't work");
  EXPECT_EQ(StringFormatter::Capitalize("mONDAY"), "Monday");
  EXPECT_TRUE(StringFormatter::StartsWith("on Monday", "on "));
  EXPECT_FALSE(StringFormatter::StartsWith("on", "on "));
}
