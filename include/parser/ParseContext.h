/***
 * Name: sasstree::parse::ParseContext / LineInput
 * Purpose: Per-invocation state threaded through classification.
 * Theory of Operation: ParseContext lives for one parse of one document and
 *   only holds references to its configuration and collaborators. LineInput
 *   names the line being classified; the line's index is the "current line"
 *   every diagnostic is attributed to, so nothing is kept in shared state.
 */
#pragma once

#include "ast/Node.h"
#include "lexer/LogicalLine.h"
#include "sasstree/config/options.h"
#include "sasstree/support/import_resolver.h"
#include "script/ExpressionParser.h"

namespace sasstree::parse {

struct ParseContext {
    const config::Options& options;
    const script::ExpressionParser& expressions;
    const support::ImportResolver& imports;
};

struct LineInput {
    const ParseContext& ctx;
    const lex::LogicalLine& line;
    ast::Node& parent; // node whose children are being built
    bool root;         // parent is the document root
};

} // namespace sasstree::parse
