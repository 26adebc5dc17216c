/***
 * Name: sasstree::script::ExpressionParser
 * Purpose: Collaborator interface for the expression language.
 * Inputs:
 *   - text: expression source
 *   - line: 1-based line of the expression
 *   - offset: column of the expression within that line
 *   - filename: document name (may be empty)
 * Outputs: Parsed expression
 * Theory of Operation: Implementations throw exceptions::ScriptError on
 *   malformed input; the classifier rethrows it as a SyntaxError.
 */
#pragma once

#include <memory>
#include <string>
#include "script/Expression.h"

namespace sasstree::script {

class ExpressionParser {
 public:
  virtual ~ExpressionParser() = default;

  virtual std::unique_ptr<Expression> parse(const std::string& text, int line, int offset,
                                            const std::string& filename) const = 0;
};

} // namespace sasstree::script
