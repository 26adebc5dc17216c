/***
 * Name: sasstree::parse::rules::ElseDirective
 * Purpose: Attach `@else` / `@else if <expr>` to the preceding @if.
 * Theory of Operation: The branch never becomes a sibling. Its children are
 *   assembled here and it is hung off the end of the previous IfNode's else
 *   chain, so the result is always NoOp.
 */
#include "parser/Rules.h"

#include <utility>

#include "ast/IfNode.h"
#include "parser/Assembler.h"
#include "parser/LinePatterns.h"
#include "sasstree/exceptions/syntax_error.h"

namespace sasstree::parse::rules {

ClassifyResult ElseDirective(const LineInput& in, const DirectiveParts& parts) {
  ast::Node* previous = in.parent.last();
  if (previous == nullptr || previous->kind != ast::NodeKind::If) {
    throw exceptions::SyntaxError("@else must come after @if.", in.line.index);
  }

  std::unique_ptr<script::Expression> guard;
  if (parts.value) {
    const auto condition = patterns::MatchElseGuard(*parts.value);
    if (!condition) {
      throw exceptions::SyntaxError("Invalid else directive '@else " + *parts.value + "': expected 'if <expr>'.",
                                    in.line.index);
    }
    guard = ParseScript(in, condition->text, parts.valueOffset + static_cast<int>(condition->pos));
  }

  auto branch = std::make_unique<ast::IfNode>(std::move(guard));
  branch->line = in.line.index;
  branch->file = in.line.filename;
  AppendChildren(in.ctx, *branch, in.line.children, false);
  static_cast<ast::IfNode*>(previous)->addElse(std::move(branch));
  return ClassifyResult::Nothing();
}

} // namespace sasstree::parse::rules
