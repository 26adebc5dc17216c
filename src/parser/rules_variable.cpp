/***
 * Name: sasstree::parse::rules::Variable
 * Purpose: `!name = expr` and the guarded `!name ||= expr`.
 */
#include "parser/Rules.h"

#include <utility>

#include "ast/VariableNode.h"
#include "parser/LinePatterns.h"
#include "sasstree/exceptions/syntax_error.h"

namespace sasstree::parse::rules {

ClassifyResult Variable(const LineInput& in) {
  const std::string& text = in.line.text;
  if (!in.line.children.empty()) {
    throw exceptions::SyntaxError("Illegal nesting: Nothing may be nested beneath variable declarations.",
                                  in.line.children.front().index);
  }
  const auto match = patterns::MatchVariable(text);
  if (!match) {
    throw exceptions::SyntaxError("Invalid variable: \"" + text + "\".", in.line.index);
  }
  const int offset = in.line.offset + static_cast<int>(match->value.pos);
  auto node = std::make_unique<ast::VariableNode>(match->name, ParseScript(in, match->value.text, offset),
                                                  match->guarded);
  return ClassifyResult::Produced(std::move(node));
}

} // namespace sasstree::parse::rules
