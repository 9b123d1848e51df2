// an_lex/syntax/token_tree.hpp - Spanned token trees
//
// A TokenTree is either a leaf Token or a delimited group of child trees.
// Trees are built bottom-up by the lexer and never change afterwards; every
// node owns its children by value.
//
#pragma once

#include <cstdint>
#include <gsl/span>
#include <string_view>
#include <utility>
#include <vector>

#include "an_lex/basic/source_manager.hpp"
#include "an_lex/syntax/token.hpp"

namespace an_lex::syntax
{

enum class DelimiterKind : uint8_t {
  Block,          ///< indentation-derived
  Parenthesis,    ///< ( ... )
  Curly,          ///< one ${ ... } splice
  Interpolation,  ///< a whole string literal
};

/**
 * Juxtaposition tag for identifiers and integers.
 *
 * Sequential: another identifier/integer follows on the same line after
 * inline whitespace only. Terminal: it does not. Every other leaf is None.
 */
enum class Adjacency : uint8_t {
  None,
  Sequential,
  Terminal,
};

class TokenTree
{
public:
  [[nodiscard]] static TokenTree leaf(
    Token token, SourceRange range, Adjacency adjacency = Adjacency::None)
  {
    TokenTree t;
    t.is_tree_ = false;
    t.token_ = std::move(token);
    t.adjacency_ = adjacency;
    t.range_ = range;
    return t;
  }

  [[nodiscard]] static TokenTree group(
    DelimiterKind delimiter, std::vector<TokenTree> children, SourceRange range)
  {
    TokenTree t;
    t.is_tree_ = true;
    t.delimiter_ = delimiter;
    t.children_ = std::move(children);
    t.range_ = range;
    return t;
  }

  [[nodiscard]] bool is_token() const noexcept { return !is_tree_; }
  [[nodiscard]] bool is_tree() const noexcept { return is_tree_; }

  /// The leaf token; only meaningful when is_token()
  [[nodiscard]] const Token & token() const noexcept { return token_; }
  [[nodiscard]] Adjacency adjacency() const noexcept { return adjacency_; }

  /// The delimiter; only meaningful when is_tree()
  [[nodiscard]] DelimiterKind delimiter() const noexcept { return delimiter_; }
  [[nodiscard]] gsl::span<const TokenTree> children() const noexcept
  {
    return gsl::span<const TokenTree>(children_.data(), children_.size());
  }

  [[nodiscard]] SourceRange range() const noexcept { return range_; }

  [[nodiscard]] bool is_token(TokenKind kind) const noexcept
  {
    return !is_tree_ && token_.kind == kind;
  }
  [[nodiscard]] bool is_tree(DelimiterKind kind) const noexcept
  {
    return is_tree_ && delimiter_ == kind;
  }

  /// Structural equality: tokens, delimiters and shape. Spans and tags are ignored.
  [[nodiscard]] bool same_structure(const TokenTree & other) const;

private:
  TokenTree() = default;

  bool is_tree_ = false;
  Token token_;
  Adjacency adjacency_ = Adjacency::None;
  DelimiterKind delimiter_ = DelimiterKind::Block;
  std::vector<TokenTree> children_;
  SourceRange range_;
};

[[nodiscard]] constexpr std::string_view to_string(DelimiterKind k) noexcept
{
  switch (k) {
    case DelimiterKind::Block:
      return "Block";
    case DelimiterKind::Parenthesis:
      return "Parenthesis";
    case DelimiterKind::Curly:
      return "Curly";
    case DelimiterKind::Interpolation:
      return "Interpolation";
  }
  return "";
}

[[nodiscard]] constexpr std::string_view to_string(Adjacency a) noexcept
{
  switch (a) {
    case Adjacency::None:
      return "none";
    case Adjacency::Sequential:
      return "sequential";
    case Adjacency::Terminal:
      return "terminal";
  }
  return "";
}

}  // namespace an_lex::syntax
