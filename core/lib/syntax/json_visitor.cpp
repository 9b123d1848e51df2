// an_lex/syntax/json_visitor.cpp - JSON serialization implementation
//
#include "an_lex/syntax/json_visitor.hpp"

#include <string>

namespace an_lex::syntax
{
namespace
{

using nlohmann::json;

json j_range(SourceRange r)
{
  if (r.is_invalid()) {
    return json{{"start", nullptr}, {"end", nullptr}};
  }
  return json{{"start", r.begin_offset()}, {"end", r.end_offset()}};
}

json j_token(const TokenTree & leaf)
{
  const Token & t = leaf.token();
  json j{{"kind", std::string(to_string(t.kind))}, {"range", j_range(leaf.range())}};

  switch (t.kind) {
    case TokenKind::Identifier:
    case TokenKind::StringLiteral:
      j["text"] = t.text;
      break;
    case TokenKind::Integer:
      j["value"] = t.value;
      j["suffix"] = t.suffix ? json(std::string(to_string(*t.suffix))) : json(nullptr);
      break;
    case TokenKind::Operator:
      j["operator"] = std::string(to_string(t.op));
      break;
    case TokenKind::Comment:
      break;
  }

  if (leaf.adjacency() != Adjacency::None) {
    j["adjacency"] = std::string(to_string(leaf.adjacency()));
  }
  return j;
}

}  // namespace

json to_json(const TokenTree & tree)
{
  if (tree.is_token()) {
    return j_token(tree);
  }

  json children = json::array();
  for (const auto & child : tree.children()) {
    children.push_back(to_json(child));
  }
  return json{
    {"kind", "Tree"},
    {"delimiter", std::string(to_string(tree.delimiter()))},
    {"children", std::move(children)},
    {"range", j_range(tree.range())}};
}

json to_json(const LexError & error)
{
  json j{
    {"kind", std::string(to_string(error.kind))},
    {"code", std::string(error_code(error.kind))},
    {"message", error.message()},
    {"position", error.position},
    {"start", error.start},
    {"expected", error.expected},
    {"range", j_range(error.range)}};
  j["delimiter"] =
    error.delimiter ? json(std::string(to_string(*error.delimiter))) : json(nullptr);
  if (!error.found.empty()) {
    j["found"] = error.found;
  }
  return j;
}

}  // namespace an_lex::syntax
