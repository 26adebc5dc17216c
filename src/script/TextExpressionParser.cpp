/***
 * Name: sasstree::script::TextExpressionParser::parse
 * Purpose: Validate expression shape and keep its source.
 */
#include "script/TextExpressionParser.h"

#include "sasstree/exceptions/script_error.h"
#include "sasstree/support/text.h"

#include <memory>
#include <string>

namespace sasstree::script {

std::unique_ptr<Expression> TextExpressionParser::parse(const std::string& text, const int line, const int offset,
                                                        const std::string& filename) const {
  const std::string source = support::Trim(text);
  if (source.empty()) {
    throw exceptions::ScriptError("Expected expression, found end of text.");
  }
  int depth = 0;
  char quote = '\0';
  for (const char chr : source) {
    if (quote != '\0') {
      if (chr == quote) { quote = '\0'; }
      continue;
    }
    if (chr == '"' || chr == '\'') { quote = chr; continue; }
    if (chr == '(') { ++depth; continue; }
    if (chr == ')' && --depth < 0) { break; }
  }
  if (quote != '\0') {
    throw exceptions::ScriptError("Unterminated string in \"" + source + "\".");
  }
  if (depth != 0) {
    throw exceptions::ScriptError("Unbalanced parentheses in \"" + source + "\".");
  }
  return std::make_unique<Expression>(source, line, offset, filename);
}

}  // namespace sasstree::script
