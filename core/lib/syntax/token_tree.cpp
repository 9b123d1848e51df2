#include "an_lex/syntax/token_tree.hpp"

#include <algorithm>

namespace an_lex::syntax
{

bool TokenTree::same_structure(const TokenTree & other) const
{
  if (is_tree_ != other.is_tree_) {
    return false;
  }
  if (!is_tree_) {
    return token_ == other.token_;
  }
  if (delimiter_ != other.delimiter_ || children_.size() != other.children_.size()) {
    return false;
  }
  return std::equal(
    children_.begin(), children_.end(), other.children_.begin(),
    [](const TokenTree & a, const TokenTree & b) { return a.same_structure(b); });
}

}  // namespace an_lex::syntax
