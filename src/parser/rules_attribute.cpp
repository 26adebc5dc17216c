/***
 * Name: sasstree::parse::rules attributes
 * Purpose: `:name value` and `name: value` property lines.
 * Theory of Operation: Both spellings share one builder; the pattern decides
 *   the style. A value introduced by `=` is handed to the expression parser
 *   at its column, otherwise the text is kept literally (possibly empty for a
 *   nested property group).
 */
#include "parser/Rules.h"

#include <optional>
#include <utility>

#include "ast/AttributeNode.h"
#include "ast/RuleNode.h"
#include "parser/LinePatterns.h"
#include "sasstree/exceptions/syntax_error.h"

namespace sasstree::parse::rules {

namespace {

ClassifyResult buildAttribute(const LineInput& in, std::optional<patterns::AttributeMatch> match,
                              const ast::AttributeStyle style) {
  if (!match) {
    throw exceptions::SyntaxError("Invalid attribute: \"" + in.line.text + "\".", in.line.index);
  }
  std::unique_ptr<ast::AttributeNode> node;
  if (!match->op.empty() && match->op.back() == '=') {
    const int offset = in.line.offset + static_cast<int>(match->value.pos);
    node = std::make_unique<ast::AttributeNode>(match->name, ParseScript(in, match->value.text, offset), style);
  } else {
    node = std::make_unique<ast::AttributeNode>(match->name, match->value.text, style);
  }
  return ClassifyResult::Produced(std::move(node));
}

} // namespace

ClassifyResult OldAttribute(const LineInput& in) {
  const std::string& text = in.line.text;
  if (text.size() > 1 && text[1] == ':') {
    return ClassifyResult::Produced(std::make_unique<ast::RuleNode>(text));
  }
  return buildAttribute(in, patterns::MatchOldAttribute(text), ast::AttributeStyle::Old);
}

ClassifyResult Plain(const LineInput& in) {
  if (patterns::LooksLikeNewAttribute(in.line.text)) {
    return buildAttribute(in, patterns::MatchNewAttribute(in.line.text), ast::AttributeStyle::New);
  }
  return ClassifyResult::Produced(std::make_unique<ast::RuleNode>(in.line.text));
}

ClassifyResult Escape(const LineInput& in) {
  return ClassifyResult::Produced(std::make_unique<ast::RuleNode>(in.line.text.substr(1)));
}

} // namespace sasstree::parse::rules
