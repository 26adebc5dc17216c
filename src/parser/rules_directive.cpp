/***
 * Name: sasstree::parse::rules::Directive
 * Purpose: `@keyword rest` sub-dispatch and the expression-only directives.
 * Theory of Operation: The keyword is looked up in a small table; unknown
 *   keywords are passed through verbatim as a DirectiveNode.
 */
#include "parser/Rules.h"

#include <array>
#include <utility>

#include "ast/DebugNode.h"
#include "ast/DirectiveNode.h"
#include "ast/IfNode.h"
#include "ast/WhileNode.h"
#include "sasstree/exceptions/syntax_error.h"

namespace sasstree::parse::rules {

namespace {

using DirectiveFn = ClassifyResult (*)(const LineInput&, const DirectiveParts&);

struct DirectiveEntry {
  const char* keyword;
  DirectiveFn handler;
};

constexpr std::array<DirectiveEntry, 6> kDirectives{{
    {"import", &ImportDirective},
    {"for", &ForDirective},
    {"else", &ElseDirective},
    {"while", &WhileDirective},
    {"if", &IfDirective},
    {"debug", &DebugDirective},
}};

std::unique_ptr<script::Expression> requireExpression(const LineInput& in, const DirectiveParts& parts) {
  if (!parts.value) {
    throw exceptions::SyntaxError(
        "Invalid " + parts.keyword + " directive '@" + parts.keyword + "': expected expression.", in.line.index);
  }
  return ParseScript(in, *parts.value, parts.valueOffset);
}

} // namespace

DirectiveParts SplitDirective(const lex::LogicalLine& line) {
  DirectiveParts parts;
  const std::string rest = line.text.substr(1);
  const auto gap = rest.find_first_of(" \t");
  parts.keyword = rest.substr(0, gap);
  if (gap == std::string::npos) { return parts; }
  const auto start = rest.find_first_not_of(" \t", gap);
  if (start == std::string::npos) { return parts; }
  parts.value = rest.substr(start);
  parts.valueOffset = line.offset + 1 + static_cast<int>(start);
  return parts;
}

ClassifyResult Directive(const LineInput& in) {
  const DirectiveParts parts = SplitDirective(in.line);
  for (const auto& entry : kDirectives) {
    if (parts.keyword == entry.keyword) { return entry.handler(in, parts); }
  }
  return ClassifyResult::Produced(std::make_unique<ast::DirectiveNode>(in.line.text));
}

ClassifyResult WhileDirective(const LineInput& in, const DirectiveParts& parts) {
  return ClassifyResult::Produced(std::make_unique<ast::WhileNode>(requireExpression(in, parts)));
}

ClassifyResult IfDirective(const LineInput& in, const DirectiveParts& parts) {
  return ClassifyResult::Produced(std::make_unique<ast::IfNode>(requireExpression(in, parts)));
}

ClassifyResult DebugDirective(const LineInput& in, const DirectiveParts& parts) {
  if (!in.line.children.empty()) {
    throw exceptions::SyntaxError("Illegal nesting: Nothing may be nested beneath debug directives.",
                                  in.line.children.front().index);
  }
  auto expr = requireExpression(in, parts);
  return ClassifyResult::Produced(std::make_unique<ast::DebugNode>(std::move(expr)));
}

} // namespace sasstree::parse::rules
