#include <gtest/gtest.h>

#include "an_lex/basic/source_manager.hpp"

using an_lex::SourceFile;
using an_lex::SourceRange;

TEST(BasicSourceFile, LineColumnLookup)
{
  const SourceFile file("main.an", "ab\ncd\n\nef");
  EXPECT_EQ(file.line_count(), 4U);

  auto lc = file.get_line_column(0);
  EXPECT_EQ(lc.line, 1U);
  EXPECT_EQ(lc.column, 1U);

  lc = file.get_line_column(4);
  EXPECT_EQ(lc.line, 2U);
  EXPECT_EQ(lc.column, 2U);

  lc = file.get_line_column(7);
  EXPECT_EQ(lc.line, 4U);
  EXPECT_EQ(lc.column, 1U);

  // End of input is addressable
  lc = file.get_line_column(9);
  EXPECT_EQ(lc.line, 4U);
  EXPECT_EQ(lc.column, 3U);
}

TEST(BasicSourceFile, CrLfAndLoneCr)
{
  const SourceFile file("a\r\nb\rc");
  EXPECT_EQ(file.line_count(), 3U);
  EXPECT_EQ(file.get_line(0), "a");
  EXPECT_EQ(file.get_line(1), "b");
  EXPECT_EQ(file.get_line(2), "c");
  EXPECT_EQ(file.get_line_column(3).line, 2U);
  EXPECT_EQ(file.get_line_column(5).line, 3U);
}

TEST(BasicSourceFile, SlicesAndRanges)
{
  const SourceFile file("let x\n  = 1");
  EXPECT_EQ(file.get_slice(SourceRange(4, 5)), "x");
  EXPECT_EQ(file.get_slice(SourceRange()), "");

  const auto fr = file.get_full_range(SourceRange(4, 9));
  ASSERT_TRUE(fr.is_valid());
  EXPECT_EQ(fr.start_line, 1U);
  EXPECT_EQ(fr.start_column, 5U);
  EXPECT_EQ(fr.end_line, 2U);
  EXPECT_EQ(fr.end_column, 4U);
}

TEST(BasicSourceFile, DisplayName)
{
  EXPECT_EQ(SourceFile("x").display_name(), "<input>");
  EXPECT_EQ(SourceFile("dir/main.an", "x").display_name(), "dir/main.an");
}

TEST(BasicSourceRange, Contains)
{
  const SourceRange outer(2, 10);
  EXPECT_TRUE(outer.contains(SourceRange(2, 10)));
  EXPECT_TRUE(outer.contains(SourceRange(3, 3)));
  EXPECT_FALSE(outer.contains(SourceRange(1, 4)));
  EXPECT_EQ(outer.size(), 8U);
  EXPECT_EQ(SourceRange().size(), 0U);
}
