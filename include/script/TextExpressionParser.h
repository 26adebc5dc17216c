/***
 * Name: sasstree::script::TextExpressionParser
 * Purpose: Default expression collaborator that keeps expressions as text.
 * Theory of Operation: Performs the shape checks every expression must pass
 *   (non-empty, balanced parentheses, terminated strings) and returns the
 *   trimmed source wrapped in an Expression.
 */
#pragma once

#include <memory>
#include <string>
#include "script/ExpressionParser.h"

namespace sasstree::script {

class TextExpressionParser final : public ExpressionParser {
 public:
  std::unique_ptr<Expression> parse(const std::string& text, int line, int offset,
                                    const std::string& filename) const override;
};

} // namespace sasstree::script
