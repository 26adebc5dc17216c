/***
 * Name: sasstree::parse::rules::Comment
 * Purpose: `//` silent and `/*` loud comments; any other `/` line is a rule.
 * Theory of Operation: Lines nested under a comment are comment text, not
 *   syntax. They are collected verbatim in depth-first order.
 */
#include "parser/Rules.h"

#include <utility>

#include "ast/CommentNode.h"
#include "ast/RuleNode.h"

namespace sasstree::parse::rules {

namespace {
void collectLines(const std::vector<lex::LogicalLine>& children, std::vector<std::string>& out) {
  for (const auto& child : children) {
    out.push_back(child.text);
    collectLines(child.children, out);
  }
}
} // namespace

ClassifyResult Comment(const LineInput& in) {
  const std::string& text = in.line.text;
  if (text.size() < 2 || (text[1] != '/' && text[1] != '*')) {
    return ClassifyResult::Produced(std::make_unique<ast::RuleNode>(text));
  }
  auto node = std::make_unique<ast::CommentNode>(text, text[1] == '/');
  collectLines(in.line.children, node->lines);
  return ClassifyResult::Produced(std::move(node));
}

} // namespace sasstree::parse::rules
