/***
 * Name: sasstree::parse::rules helpers
 * Purpose: Expression delegation, column lookup and argument-list splitting
 *   shared by the classification rules.
 */
#include "parser/Rules.h"

#include <utility>

#include "parser/LinePatterns.h"
#include "sasstree/exceptions/script_error.h"
#include "sasstree/exceptions/syntax_error.h"
#include "sasstree/support/text.h"

namespace sasstree::parse::rules {

std::unique_ptr<script::Expression> ParseScript(const LineInput& in, const std::string& text, const int offset) {
  try {
    return in.ctx.expressions.parse(text, in.line.index, offset, in.line.filename);
  } catch (const exceptions::ScriptError& e) {
    throw exceptions::SyntaxError(e.what(), in.line.index);
  }
}

int ColumnOf(const lex::LogicalLine& line, const std::string& fragment) {
  const auto pos = line.text.find(fragment);
  if (pos == std::string::npos) { return 0; }
  return line.offset + static_cast<int>(pos);
}

bool IsValidVariable(std::string_view name) {
  return patterns::IsVariableName(name);
}

std::optional<std::vector<std::string>> ParseMixinArguments(std::string_view argString) {
  const std::string s = support::Trim(argString);
  if (s.empty()) { return std::vector<std::string>{}; }
  if (s.size() < 2 || s.front() != '(' || s.back() != ')') { return std::nullopt; }
  std::vector<std::string> args = support::SplitList(std::string_view(s).substr(1, s.size() - 2), ',', true);
  for (auto& a : args) { a = support::Trim(a); }
  return args;
}

} // namespace sasstree::parse::rules
