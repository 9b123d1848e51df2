#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "an_lex/test_support/lex_helpers.hpp"

using an_lex::syntax::Adjacency;
using an_lex::syntax::DelimiterKind;
using an_lex::syntax::LexErrorKind;
using an_lex::syntax::Operator;
using an_lex::syntax::TokenKind;
using an_lex::syntax::TokenTree;
using an_lex::test_support::lex;
using an_lex::test_support::top_level;

static const TokenTree & only_item(const an_lex::test_support::TestLexUnit & unit)
{
  const auto items = top_level(unit);
  EXPECT_EQ(items.size(), 1U);
  return items[0];
}

// ============================================================================
// Literal runs
// ============================================================================

TEST(SyntaxStrings, EmptyStringHasNoChildren)
{
  auto unit = lex(R"("")");
  ASSERT_TRUE(unit->ok());
  const TokenTree & s = only_item(*unit);
  ASSERT_TRUE(s.is_tree(DelimiterKind::Interpolation));
  EXPECT_TRUE(s.children().empty());
  EXPECT_EQ(s.range().begin_offset(), 0U);
  EXPECT_EQ(s.range().end_offset(), 2U);
}

TEST(SyntaxStrings, PlainString)
{
  auto unit = lex(R"("hello world")");
  ASSERT_TRUE(unit->ok());
  const TokenTree & s = only_item(*unit);
  ASSERT_TRUE(s.is_tree(DelimiterKind::Interpolation));
  ASSERT_EQ(s.children().size(), 1U);
  ASSERT_TRUE(s.children()[0].is_token(TokenKind::StringLiteral));
  EXPECT_EQ(s.children()[0].token().text, "hello world");
  EXPECT_EQ(s.children()[0].adjacency(), Adjacency::None);
}

TEST(SyntaxStrings, EscapedNewlineDecodesToOneCharacter)
{
  auto unit = lex(R"("a\nb")");
  ASSERT_TRUE(unit->ok());
  const TokenTree & s = only_item(*unit);
  ASSERT_EQ(s.children().size(), 1U);
  EXPECT_EQ(s.children()[0].token().text, "a\nb");
  EXPECT_EQ(s.children()[0].token().text.size(), 3U);
}

TEST(SyntaxStrings, EscapesMergeIntoOneRun)
{
  auto unit = lex(R"("q\"\\\$x")");
  ASSERT_TRUE(unit->ok());
  const TokenTree & s = only_item(*unit);
  ASSERT_EQ(s.children().size(), 1U);
  EXPECT_EQ(s.children()[0].token().text, "q\"\\$x");
}

TEST(SyntaxStrings, EscapedDollarDoesNotOpenSplice)
{
  auto unit = lex(R"("\${x}")");
  ASSERT_TRUE(unit->ok());
  const TokenTree & s = only_item(*unit);
  ASSERT_EQ(s.children().size(), 1U);
  EXPECT_EQ(s.children()[0].token().text, "${x}");
}

TEST(SyntaxStrings, LoneDollarIsLiteral)
{
  auto unit = lex(R"("$5 and $")");
  ASSERT_TRUE(unit->ok());
  const TokenTree & s = only_item(*unit);
  ASSERT_EQ(s.children().size(), 1U);
  EXPECT_EQ(s.children()[0].token().text, "$5 and $");
}

TEST(SyntaxStrings, StringMaySpanLines)
{
  auto unit = lex("\"one\ntwo\"\nx");
  ASSERT_TRUE(unit->ok());
  const auto items = top_level(*unit);
  ASSERT_EQ(items.size(), 2U);
  EXPECT_EQ(items[0].children()[0].token().text, "one\ntwo");
  EXPECT_EQ(items[1].token().text, "x");
}

// ============================================================================
// Interpolation
// ============================================================================

TEST(SyntaxStrings, SpliceBetweenLiterals)
{
  auto unit = lex(R"("a${1+2}b")");
  ASSERT_TRUE(unit->ok());
  const TokenTree & s = only_item(*unit);
  ASSERT_TRUE(s.is_tree(DelimiterKind::Interpolation));
  ASSERT_EQ(s.children().size(), 3U);

  EXPECT_EQ(s.children()[0].token().text, "a");

  const TokenTree & curly = s.children()[1];
  ASSERT_TRUE(curly.is_tree(DelimiterKind::Curly));
  ASSERT_EQ(curly.children().size(), 3U);
  EXPECT_EQ(curly.children()[0].token().value, 1U);
  EXPECT_EQ(curly.children()[0].adjacency(), Adjacency::Terminal);
  EXPECT_EQ(curly.children()[1].token().op, Operator::Add);
  EXPECT_EQ(curly.children()[2].token().value, 2U);
  EXPECT_EQ(unit->slice(curly.range()), "${1+2}");

  EXPECT_EQ(s.children()[2].token().text, "b");
}

TEST(SyntaxStrings, AdjacentSplicesHaveNoEmptyLiterals)
{
  auto unit = lex(R"("${a}${b}")");
  ASSERT_TRUE(unit->ok());
  const TokenTree & s = only_item(*unit);
  ASSERT_EQ(s.children().size(), 2U);
  EXPECT_TRUE(s.children()[0].is_tree(DelimiterKind::Curly));
  EXPECT_TRUE(s.children()[1].is_tree(DelimiterKind::Curly));
}

TEST(SyntaxStrings, SpliceIsWhitespacePadded)
{
  auto unit = lex("\"${ \n  f x\n}\"");
  ASSERT_TRUE(unit->ok());
  const TokenTree & curly = only_item(*unit).children()[0];
  ASSERT_TRUE(curly.is_tree(DelimiterKind::Curly));
  ASSERT_EQ(curly.children().size(), 2U);
  EXPECT_EQ(curly.children()[0].adjacency(), Adjacency::Sequential);
  EXPECT_EQ(curly.children()[1].adjacency(), Adjacency::Terminal);
}

TEST(SyntaxStrings, EmptySplice)
{
  auto unit = lex(R"("${}")");
  ASSERT_TRUE(unit->ok());
  const TokenTree & s = only_item(*unit);
  ASSERT_EQ(s.children().size(), 1U);
  EXPECT_TRUE(s.children()[0].is_tree(DelimiterKind::Curly));
  EXPECT_TRUE(s.children()[0].children().empty());
}

TEST(SyntaxStrings, NestedStringsInsideSplices)
{
  auto unit = lex(R"("x${ "y${ (z) }" }")");
  ASSERT_TRUE(unit->ok());
  const TokenTree & outer = only_item(*unit);
  ASSERT_EQ(outer.children().size(), 2U);

  const TokenTree & inner = outer.children()[1].children()[0];
  ASSERT_TRUE(inner.is_tree(DelimiterKind::Interpolation));
  ASSERT_EQ(inner.children().size(), 2U);
  EXPECT_EQ(inner.children()[0].token().text, "y");

  const TokenTree & paren = inner.children()[1].children()[0];
  ASSERT_TRUE(paren.is_tree(DelimiterKind::Parenthesis));
  EXPECT_EQ(paren.children()[0].token().text, "z");
}

TEST(SyntaxStrings, StringEndsAdjacency)
{
  auto unit = lex(R"(print "a" x)");
  ASSERT_TRUE(unit->ok());
  const auto items = top_level(*unit);
  ASSERT_EQ(items.size(), 3U);
  EXPECT_EQ(items[0].adjacency(), Adjacency::Terminal);
  EXPECT_TRUE(items[1].is_tree(DelimiterKind::Interpolation));
  EXPECT_EQ(items[2].adjacency(), Adjacency::Terminal);
}

// ============================================================================
// Errors
// ============================================================================

TEST(SyntaxStrings, UnterminatedString)
{
  auto unit = lex("x \"abc");
  ASSERT_FALSE(unit->ok());
  const auto & e = unit->error();
  EXPECT_EQ(e.kind, LexErrorKind::UnterminatedString);
  EXPECT_EQ(e.start, 2U);
  EXPECT_EQ(e.position, 6U);
  EXPECT_EQ(e.expected, std::vector<std::string>{"'\"'"});
  EXPECT_EQ(unit->diags.all()[0].code, "L0002");
}

TEST(SyntaxStrings, TrailingBackslashLeavesStringUnterminated)
{
  auto unit = lex("\"abc\\");
  ASSERT_FALSE(unit->ok());
  EXPECT_EQ(unit->error().kind, LexErrorKind::UnterminatedString);
  EXPECT_EQ(unit->error().start, 0U);
}

TEST(SyntaxStrings, InvalidEscape)
{
  auto unit = lex(R"("ok\q")");
  ASSERT_FALSE(unit->ok());
  const auto & e = unit->error();
  EXPECT_EQ(e.kind, LexErrorKind::InvalidEscape);
  EXPECT_EQ(e.position, 3U);
  EXPECT_EQ(e.found, "'q'");
  ASSERT_EQ(unit->diags.size(), 1U);
  EXPECT_EQ(unit->diags.all()[0].code, "L0005");
  EXPECT_TRUE(unit->diags.all()[0].help_message.has_value());
}

TEST(SyntaxStrings, UnterminatedSplice)
{
  auto unit = lex("\"a${b");
  ASSERT_FALSE(unit->ok());
  const auto & e = unit->error();
  EXPECT_EQ(e.kind, LexErrorKind::UnterminatedGroup);
  ASSERT_TRUE(e.delimiter.has_value());
  EXPECT_EQ(*e.delimiter, DelimiterKind::Curly);
  EXPECT_EQ(e.start, 2U);
  EXPECT_EQ(e.message(), "unterminated interpolation splice");
}
