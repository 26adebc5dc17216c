/***
 * Name: sasstree::parse (assembler)
 * Purpose: Build nodes for a list of sibling lines and append them to their parent.
 * Inputs:
 *   - ctx: per-parse context
 *   - parent: node receiving the children
 *   - children: structured lines
 *   - root: parent is the document root
 * Outputs: parent.children populated in source order
 * Theory of Operation:
 *   Each line is classified, stamped with its position, and given its own
 *   children recursively (comments keep their nested text instead). Rules
 *   ending in a comma accumulate until a terminal rule completes them.
 *   Mixin definitions and imports are only accepted at the root. Multi-node
 *   results are appended element by element.
 */
#pragma once

#include <memory>
#include <vector>
#include "ast/Node.h"
#include "lexer/LogicalLine.h"
#include "parser/ClassifyResult.h"
#include "parser/ParseContext.h"

namespace sasstree::parse {

void AppendChildren(const ParseContext& ctx, ast::Node& parent, const std::vector<lex::LogicalLine>& children, bool root);

/*** BuildNode: Classify one line and assemble the produced node's subtree. */
ClassifyResult BuildNode(const ParseContext& ctx, ast::Node& parent, const lex::LogicalLine& line, bool root);

/*** ValidateAndAppend: Placement check, then append. */
void ValidateAndAppend(ast::Node& parent, std::unique_ptr<ast::Node> child, const lex::LogicalLine& line, bool root);

} // namespace sasstree::parse
