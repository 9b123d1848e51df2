// an_lex/syntax/tree_dumper.hpp - Debug token tree output
//
// Dumps token trees in a human-readable tree format, useful for debugging
// and golden tests.
//
#pragma once

#include <ostream>
#include <sstream>
#include <string>
#include <string_view>

#include "an_lex/syntax/token_tree.hpp"

namespace an_lex::syntax
{

/**
 * Dumps a token tree with one node per line.
 *
 * @code
 *   Block
 *   |-Identifier 'print' sequential
 *   |-Identifier 'x' terminal
 *   `-Block
 *     `-Interpolation
 *       |-StringLiteral "a"
 *       `-Curly
 *         `-Integer 1 suffix='u8' terminal
 * @endcode
 */
class TreeDumper
{
public:
  explicit TreeDumper(std::ostream & os, bool show_ranges = false)
  : os_(os), show_ranges_(show_ranges)
  {
  }

  void dump(const TokenTree & root)
  {
    print_node(root);
    print_children(root);
  }

private:
  void print_children(const TokenTree & node)
  {
    if (!node.is_tree()) {
      return;
    }
    const auto children = node.children();
    for (size_t i = 0; i < children.size(); ++i) {
      const bool last = (i + 1 == children.size());
      os_ << prefix_ << (last ? "`-" : "|-");
      print_node(children[i]);

      const std::string saved = prefix_;
      prefix_ += last ? "  " : "| ";
      print_children(children[i]);
      prefix_ = saved;
    }
  }

  void print_node(const TokenTree & node)
  {
    if (node.is_tree()) {
      os_ << to_string(node.delimiter());
    } else {
      print_token(node.token());
      if (node.adjacency() != Adjacency::None) {
        os_ << " " << to_string(node.adjacency());
      }
    }
    if (show_ranges_) {
      os_ << " [" << node.range().begin_offset() << ", " << node.range().end_offset() << ")";
    }
    os_ << "\n";
  }

  void print_token(const Token & t)
  {
    os_ << to_string(t.kind);
    switch (t.kind) {
      case TokenKind::Identifier:
        os_ << " '" << t.text << "'";
        break;
      case TokenKind::StringLiteral:
        os_ << " \"" << escape(t.text) << "\"";
        break;
      case TokenKind::Integer:
        os_ << " " << t.value;
        if (t.suffix) {
          os_ << " suffix='" << to_string(*t.suffix) << "'";
        }
        break;
      case TokenKind::Operator:
        os_ << " '" << to_string(t.op) << "'";
        break;
      case TokenKind::Comment:
        break;
    }
  }

  static std::string escape(std::string_view s)
  {
    std::string out;
    out.reserve(s.size());
    for (const char c : s) {
      switch (c) {
        case '\n':
          out += "\\n";
          break;
        case '\r':
          out += "\\r";
          break;
        case '\t':
          out += "\\t";
          break;
        case '\0':
          out += "\\0";
          break;
        case '"':
          out += "\\\"";
          break;
        case '\\':
          out += "\\\\";
          break;
        default:
          out += c;
      }
    }
    return out;
  }

  std::ostream & os_;
  bool show_ranges_;
  std::string prefix_;
};

// ============================================================================
// Convenience Functions
// ============================================================================

inline void dump(const TokenTree & tree, std::ostream & os, bool show_ranges = false)
{
  TreeDumper dumper(os, show_ranges);
  dumper.dump(tree);
}

inline std::string dump_to_string(const TokenTree & tree, bool show_ranges = false)
{
  std::ostringstream ss;
  dump(tree, ss, show_ranges);
  return ss.str();
}

}  // namespace an_lex::syntax
