// an_lex/syntax/indentation.hpp - Blocks from leading whitespace
#pragma once

#include <cstdint>
#include <string_view>
#include <vector>

#include "an_lex/basic/source_manager.hpp"
#include "an_lex/syntax/lex_error.hpp"
#include "an_lex/syntax/token_tree.hpp"

namespace an_lex::syntax
{

/**
 * Folds logical lines into nested Block trees.
 *
 * Open levels form a stack of whitespace segments; the root level has the
 * empty segment. A line's indentation is matched against the stack by
 * prefix, one segment per level:
 *
 * @code
 *   a          // root
 *     b        // opens level "  "
 *       c      // opens level "  " below it
 *     d        // closes the innermost level
 *   e          // closes the remaining one
 * @endcode
 *
 * gives Block[a, Block[b, Block[c], d], e]. A line that closes levels must
 * land exactly on an open level.
 */
class IndentationGrouper
{
public:
  explicit IndentationGrouper(uint32_t max_depth);

  /**
   * Add one logical line.
   *
   * @param indent The line's leading whitespace; must stay valid until finish()
   * @param content Range from the first non-whitespace byte to the end of the
   *                last item (empty when the line has no items)
   * @param items The line's token trees, in order
   * @return false on InconsistentIndentation or NestingTooDeep (see failure())
   */
  [[nodiscard]] bool add_line(
    std::string_view indent, SourceRange content, std::vector<TokenTree> items);

  /// Close every open level and return the top-level Block spanning `whole`
  [[nodiscard]] TokenTree finish(SourceRange whole);

  /// Number of open levels below the root
  [[nodiscard]] size_t depth() const noexcept { return levels_.size() - 1; }

  [[nodiscard]] const LexError & failure() const noexcept { return failure_; }

private:
  struct Level
  {
    std::string_view segment;
    uint32_t begin = 0;
    uint32_t end = 0;
    std::vector<TokenTree> items;
  };

  /// Pop levels until `count` remain, folding each into its parent
  void close_to(size_t count);

  uint32_t max_depth_;
  std::vector<Level> levels_;
  LexError failure_;
};

}  // namespace an_lex::syntax
