/***
 * Name: sasstree::parse (assembler impl)
 * Purpose: Classify sibling lines, merge comma-continued rules, enforce
 *   root-only placement and append to the parent.
 */
#include "parser/Assembler.h"

#include <utility>

#include "ast/RuleNode.h"
#include "parser/Classifier.h"
#include "sasstree/exceptions/syntax_error.h"

namespace sasstree::parse {

namespace {
constexpr const char* kTrailingComma = "Rules can't end in commas.";

void stamp(ast::Node& node, const lex::LogicalLine& line) {
  node.line = line.index;
  node.file = line.filename;
}
} // namespace

ClassifyResult BuildNode(const ParseContext& ctx, ast::Node& parent, const lex::LogicalLine& line, const bool root) {
  const LineInput in{ctx, line, parent, root};
  ClassifyResult result = ClassifyLine(in);
  switch (result.kind()) {
    case ClassifyResult::Kind::ProducedNode: {
      ast::Node& node = *result.node();
      stamp(node, line);
      // Comment bodies were already captured as raw text
      if (node.kind != ast::NodeKind::Comment) { AppendChildren(ctx, node, line.children, false); }
      break;
    }
    case ClassifyResult::Kind::ProducedNodes:
      for (const auto& node : result.nodes()) { stamp(*node, line); }
      break;
    case ClassifyResult::Kind::NoOp:
      break;
  }
  return result;
}

void ValidateAndAppend(ast::Node& parent, std::unique_ptr<ast::Node> child, const lex::LogicalLine& line, const bool root) {
  if (!root) {
    switch (child->kind) {
      case ast::NodeKind::MixinDef:
        throw exceptions::SyntaxError("Mixins may only be defined at the root of a document.", line.index);
      case ast::NodeKind::File:
      case ast::NodeKind::CssImport:
        throw exceptions::SyntaxError("Import directives may only be used at the root of a document.", line.index);
      default:
        break;
    }
  }
  parent.children.push_back(std::move(child));
}

// NOLINTNEXTLINE(readability-function-cognitive-complexity)
void AppendChildren(const ParseContext& ctx, ast::Node& parent, const std::vector<lex::LogicalLine>& children,
                    const bool root) {
  std::unique_ptr<ast::RuleNode> pending;
  for (const auto& line : children) {
    ClassifyResult result = BuildNode(ctx, parent, line, root);

    if (result.kind() != ClassifyResult::Kind::ProducedNode) {
      if (pending) { throw exceptions::SyntaxError(kTrailingComma, pending->line); }
      for (auto& node : result.takeNodes()) { ValidateAndAppend(parent, std::move(node), line, root); }
      continue;
    }

    std::unique_ptr<ast::Node> node = result.takeNode();
    if (node->kind != ast::NodeKind::Rule) {
      if (pending) { throw exceptions::SyntaxError(kTrailingComma, pending->line); }
      ValidateAndAppend(parent, std::move(node), line, root);
      continue;
    }

    auto* rule = static_cast<ast::RuleNode*>(node.get());
    if (rule->continued()) {
      if (!rule->children.empty()) { throw exceptions::SyntaxError(kTrailingComma, rule->line); }
      if (pending) {
        pending->addRules(*rule);
      } else {
        pending.reset(static_cast<ast::RuleNode*>(node.release()));
      }
      continue;
    }
    if (pending) {
      pending->addRules(*rule);
      pending->children = std::move(rule->children);
      node = std::move(pending);
    }
    ValidateAndAppend(parent, std::move(node), line, root);
  }
  if (pending) { throw exceptions::SyntaxError(kTrailingComma, pending->line); }
}

} // namespace sasstree::parse
