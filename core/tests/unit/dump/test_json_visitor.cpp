// test_json_visitor.cpp - Unit tests for token tree JSON serialization
//
#include <gtest/gtest.h>

#include <nlohmann/json.hpp>
#include <string>

#include "an_lex/syntax/json_visitor.hpp"
#include "an_lex/test_support/lex_helpers.hpp"

using nlohmann::json;

namespace an_lex::syntax
{

class JsonVisitorTest : public ::testing::Test
{
protected:
  static json lex_and_serialize(const std::string & source)
  {
    auto unit = test_support::lex(source);
    EXPECT_TRUE(unit->ok());
    if (!unit->ok()) {
      return to_json(unit->error());
    }
    return to_json(unit->tree());
  }
};

TEST_F(JsonVisitorTest, EmptySource)
{
  auto j = lex_and_serialize("");
  EXPECT_EQ(j["kind"], "Tree");
  EXPECT_EQ(j["delimiter"], "Block");
  EXPECT_TRUE(j["children"].is_array());
  EXPECT_EQ(j["children"].size(), 0);
  EXPECT_EQ(j["range"]["start"], 0);
  EXPECT_EQ(j["range"]["end"], 0);
}

TEST_F(JsonVisitorTest, BareTokens)
{
  auto j = lex_and_serialize("f 42u16");
  ASSERT_EQ(j["children"].size(), 2);

  auto f = j["children"][0];
  EXPECT_EQ(f["kind"], "Identifier");
  EXPECT_EQ(f["text"], "f");
  EXPECT_EQ(f["adjacency"], "sequential");
  EXPECT_EQ(f["range"]["start"], 0);
  EXPECT_EQ(f["range"]["end"], 1);

  auto n = j["children"][1];
  EXPECT_EQ(n["kind"], "Integer");
  EXPECT_EQ(n["value"], 42);
  EXPECT_EQ(n["suffix"], "u16");
  EXPECT_EQ(n["adjacency"], "terminal");
}

TEST_F(JsonVisitorTest, OperatorsAndComments)
{
  auto j = lex_and_serialize("a = 1 // c");
  ASSERT_EQ(j["children"].size(), 4);

  auto eq = j["children"][1];
  EXPECT_EQ(eq["kind"], "Operator");
  EXPECT_EQ(eq["operator"], "=");
  EXPECT_FALSE(eq.contains("adjacency"));

  auto one = j["children"][2];
  EXPECT_TRUE(one["suffix"].is_null());

  auto c = j["children"][3];
  EXPECT_EQ(c["kind"], "Comment");
  EXPECT_EQ(c["range"]["start"], 6);
}

TEST_F(JsonVisitorTest, Interpolation)
{
  auto j = lex_and_serialize(R"("hi ${name}!")");
  auto s = j["children"][0];
  EXPECT_EQ(s["kind"], "Tree");
  EXPECT_EQ(s["delimiter"], "Interpolation");
  ASSERT_EQ(s["children"].size(), 3);
  EXPECT_EQ(s["children"][0]["kind"], "StringLiteral");
  EXPECT_EQ(s["children"][0]["text"], "hi ");
  EXPECT_EQ(s["children"][1]["delimiter"], "Curly");
  EXPECT_EQ(s["children"][1]["children"][0]["text"], "name");
  EXPECT_EQ(s["children"][2]["text"], "!");
}

TEST_F(JsonVisitorTest, ErrorSerialization)
{
  auto unit = test_support::lex("f (x");
  ASSERT_FALSE(unit->ok());

  auto j = to_json(unit->error());
  EXPECT_EQ(j["kind"], "UnterminatedGroup");
  EXPECT_EQ(j["code"], "L0004");
  EXPECT_EQ(j["message"], "unterminated parenthesis group");
  EXPECT_EQ(j["start"], 2);
  EXPECT_EQ(j["position"], 4);
  EXPECT_EQ(j["delimiter"], "Parenthesis");
  EXPECT_EQ(j["found"], "end of input");
  ASSERT_TRUE(j["expected"].is_array());
  EXPECT_EQ(j["expected"].size(), 9);
}

TEST_F(JsonVisitorTest, ErrorWithoutDelimiter)
{
  auto unit = test_support::lex("a\n    b\n  c");
  ASSERT_FALSE(unit->ok());

  auto j = to_json(unit->error());
  EXPECT_EQ(j["kind"], "InconsistentIndentation");
  EXPECT_TRUE(j["delimiter"].is_null());
  EXPECT_FALSE(j.contains("found"));
}

}  // namespace an_lex::syntax
