/***
 * Name: sasstree::parse::rules mixins
 * Purpose: `=name(!a, !b = default)` definitions and `+name(args)` includes.
 */
#include "parser/Rules.h"

#include <optional>
#include <utility>

#include "ast/MixinDefNode.h"
#include "ast/MixinNode.h"
#include "ast/RuleNode.h"
#include "parser/LinePatterns.h"
#include "sasstree/exceptions/syntax_error.h"
#include "sasstree/support/text.h"

namespace sasstree::parse::rules {

namespace {

struct SplitArg {
  std::string name;
  std::optional<std::string> defaultValue;
};

SplitArg splitDefault(const std::string& arg) {
  const auto eq = arg.find('=');
  if (eq == std::string::npos) { return {arg, std::nullopt}; }
  std::string_view rest = std::string_view(arg).substr(eq + 1);
  const auto start = rest.find_first_not_of(" \t");
  return {support::RightTrim(std::string_view(arg).substr(0, eq)),
          std::string(start == std::string_view::npos ? std::string_view{} : rest.substr(start))};
}

} // namespace

ClassifyResult MixinDefinition(const LineInput& in) {
  const std::string& text = in.line.text;
  const auto head = patterns::MatchMixinHead(text, '=');
  std::optional<std::vector<std::string>> rawArgs;
  if (head) { rawArgs = ParseMixinArguments(head->rest); }
  if (!head || !rawArgs) {
    throw exceptions::SyntaxError("Invalid mixin \"" + text.substr(1) + "\".", in.line.index);
  }

  std::vector<ast::MixinArg> args;
  bool optionalSeen = false;
  for (const auto& raw : *rawArgs) {
    if (raw.empty() || raw == "!") {
      throw exceptions::SyntaxError("Mixin arguments can't be empty.", in.line.index);
    }
    if (raw.front() != '!') {
      throw exceptions::SyntaxError("Mixin argument \"" + raw + "\" must begin with an exclamation point (!).",
                                    in.line.index);
    }
    SplitArg arg = splitDefault(raw);
    optionalSeen = optionalSeen || arg.defaultValue.has_value();
    if (!IsValidVariable(arg.name)) {
      throw exceptions::SyntaxError("Invalid variable \"" + arg.name + "\".", in.line.index);
    }
    if (optionalSeen && !arg.defaultValue) {
      throw exceptions::SyntaxError("Required arguments must not follow optional arguments \"" + arg.name + "\".",
                                    in.line.index);
    }
    ast::MixinArg parsed{arg.name.substr(1)};
    if (arg.defaultValue) {
      parsed.defaultValue = ParseScript(in, *arg.defaultValue, ColumnOf(in.line, *arg.defaultValue));
    }
    args.push_back(std::move(parsed));
  }
  return ClassifyResult::Produced(std::make_unique<ast::MixinDefNode>(support::RightTrim(head->name), std::move(args)));
}

ClassifyResult MixinInclude(const LineInput& in) {
  const std::string& text = in.line.text;
  if (text.size() == 1) {
    return ClassifyResult::Produced(std::make_unique<ast::RuleNode>(text));
  }
  const auto head = patterns::MatchMixinHead(text, '+');
  std::optional<std::vector<std::string>> rawArgs;
  if (head) { rawArgs = ParseMixinArguments(head->rest); }
  if (!in.line.children.empty()) {
    throw exceptions::SyntaxError("Illegal nesting: Nothing may be nested beneath mixin directives.",
                                  in.line.children.front().index);
  }
  if (!head || !rawArgs) {
    throw exceptions::SyntaxError("Invalid mixin include \"" + text + "\".", in.line.index);
  }

  std::vector<std::unique_ptr<script::Expression>> args;
  for (const auto& raw : *rawArgs) {
    if (raw.empty()) {
      throw exceptions::SyntaxError("Mixin arguments can't be empty.", in.line.index);
    }
    args.push_back(ParseScript(in, raw, ColumnOf(in.line, raw)));
  }
  return ClassifyResult::Produced(std::make_unique<ast::MixinNode>(support::RightTrim(head->name), std::move(args)));
}

} // namespace sasstree::parse::rules
