/***
 * Name: sasstree::parse::rules::ForDirective
 * Purpose: `@for !var from <expr> (to|through) <expr>`.
 * Theory of Operation: On a mismatch the prefix scanners find the first
 *   missing piece so the message names it.
 */
#include "parser/Rules.h"

#include <utility>

#include "ast/ForNode.h"
#include "parser/LinePatterns.h"
#include "sasstree/exceptions/syntax_error.h"

namespace sasstree::parse::rules {

namespace {
std::string expectedPiece(const std::string& text) {
  if (!patterns::HasForVariable(text)) { return "variable name"; }
  if (!patterns::HasForStart(text)) { return "'from <expr>'"; }
  return "'to <expr>' or 'through <expr>'";
}
} // namespace

ClassifyResult ForDirective(const LineInput& in, const DirectiveParts& parts) {
  const std::string text = parts.value.value_or("");
  auto match = patterns::MatchFor(text);
  if (!match) {
    const std::string shown = text.empty() ? "@for" : "@for " + text;
    throw exceptions::SyntaxError("Invalid for directive '" + shown + "': expected " + expectedPiece(text) + ".",
                                  in.line.index);
  }
  const std::string& var = match->var;
  if (!IsValidVariable(var)) {
    throw exceptions::SyntaxError("Invalid variable \"" + var + "\".", in.line.index);
  }
  auto from = ParseScript(in, match->from.text, parts.valueOffset + static_cast<int>(match->from.pos));
  auto to = ParseScript(in, match->to.text, parts.valueOffset + static_cast<int>(match->to.pos));
  auto node = std::make_unique<ast::ForNode>(var.substr(1), std::move(from), std::move(to), match->inclusive);
  return ClassifyResult::Produced(std::move(node));
}

} // namespace sasstree::parse::rules
