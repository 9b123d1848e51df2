// an_lex/syntax/lexer.hpp - Source text to token trees
//
// Grammar (one pass, no backtracking):
//
//   file         := line (newline line)*
//   line         := indent (token_tree inline_ws*)*
//   token_tree   := identifier | integer | operator | comment
//                 | '(' ws* (token_tree ws*)* ')'
//                 | '"' (literal_run | '${' ws* (token_tree ws*)* '}')* '"'
//
// Parentheses, strings and splices nest inside each other. Instead of
// recursing, the lexer keeps an explicit stack of open frames, so native
// stack use does not grow with nesting depth.
//
#pragma once

#include <algorithm>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "an_lex/syntax/indentation.hpp"
#include "an_lex/syntax/lex_error.hpp"
#include "an_lex/syntax/lex_options.hpp"
#include "an_lex/syntax/scanner.hpp"
#include "an_lex/syntax/token_tree.hpp"

namespace an_lex::syntax
{

class Lexer
{
public:
  explicit Lexer(std::string_view src, LexOptions options = {})
  : scanner_(src), options_(clamped(options)), grouper_(options_.max_nesting_depth)
  {
  }

  /// Lex the whole buffer into one top-level Block
  [[nodiscard]] LexResult lex_all();

private:
  enum class FrameKind : uint8_t {
    Line,    // a logical line; ends at newline or end of input
    Group,   // ( ... ) or ${ ... }
    String,  // " ... "
  };

  static LexOptions clamped(LexOptions options) noexcept
  {
    options.max_nesting_depth = std::min(options.max_nesting_depth, k_max_nesting_depth_limit);
    return options;
  }

  struct Frame
  {
    FrameKind kind = FrameKind::Line;
    DelimiterKind delimiter = DelimiterKind::Block;
    uint32_t start = 0;
    std::vector<TokenTree> children;
  };

  /// Run the frame machine for one logical line; its items are moved into `out`
  [[nodiscard]] bool lex_line(std::vector<TokenTree> & out);

  [[nodiscard]] bool step_group();
  [[nodiscard]] bool step_string();

  /**
   * Lex one token tree at the cursor into the innermost frame, or open a new
   * frame for '(' and '"'. The cursor must satisfy at_token_tree_start().
   */
  [[nodiscard]] bool step_token_tree();
  [[nodiscard]] bool at_token_tree_start() const noexcept;

  [[nodiscard]] bool open_frame(FrameKind kind, DelimiterKind delimiter, size_t opener_width);
  void close_frame();
  void emit(TokenTree tree) { frames_.back().children.push_back(std::move(tree)); }

  bool fail_scan();
  bool fail_unexpected(std::vector<std::string> expected);
  bool fail_unterminated_group(const Frame & frame);

  Scanner scanner_;
  LexOptions options_;
  IndentationGrouper grouper_;
  std::vector<Frame> frames_;
  LexError error_;
  size_t content_end_ = 0;  // trailing padding of the file starts here
};

/// Lex `source` in one call
[[nodiscard]] LexResult lex(std::string_view source, const LexOptions & options = {});

}  // namespace an_lex::syntax
