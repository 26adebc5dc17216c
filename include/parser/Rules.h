/***
 * Name: sasstree::parse::rules
 * Purpose: One classification rule per leading character, plus the
 *   directive keyword handlers and the helpers they share.
 * Inputs: LineInput (line, parent, root flag, context)
 * Outputs: ClassifyResult; violations throw exceptions::SyntaxError
 *   stamped with the line's index.
 */
#pragma once

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include "parser/ClassifyResult.h"
#include "parser/ParseContext.h"
#include "script/Expression.h"

namespace sasstree::parse::rules {

// Leading-character entries (see parse::DispatchTable)
ClassifyResult OldAttribute(const LineInput& in);    // `:name value`, `::` is a rule
ClassifyResult Variable(const LineInput& in);        // `!name = expr`, `!name ||= expr`
ClassifyResult Comment(const LineInput& in);         // `//` silent, `/*` loud
ClassifyResult Directive(const LineInput& in);       // `@keyword ...`
ClassifyResult Escape(const LineInput& in);          // `\` literal rule
ClassifyResult MixinDefinition(const LineInput& in); // `=name(!args)`
ClassifyResult MixinInclude(const LineInput& in);    // `+name(args)`
ClassifyResult Plain(const LineInput& in);           // `name: value` or a rule

// `@keyword value` split; value is absent when nothing follows the keyword
struct DirectiveParts {
    std::string keyword;
    std::optional<std::string> value;
    int valueOffset{0}; // column of value within the physical line
};

DirectiveParts SplitDirective(const lex::LogicalLine& line);

ClassifyResult ImportDirective(const LineInput& in, const DirectiveParts& parts);
ClassifyResult ForDirective(const LineInput& in, const DirectiveParts& parts);
ClassifyResult ElseDirective(const LineInput& in, const DirectiveParts& parts);
ClassifyResult WhileDirective(const LineInput& in, const DirectiveParts& parts);
ClassifyResult IfDirective(const LineInput& in, const DirectiveParts& parts);
ClassifyResult DebugDirective(const LineInput& in, const DirectiveParts& parts);

/*** ParseScript: Delegate to the expression collaborator; ScriptError becomes SyntaxError. */
std::unique_ptr<script::Expression> ParseScript(const LineInput& in, const std::string& text, int offset);

/*** ColumnOf: Column of the first occurrence of fragment in the physical line. */
int ColumnOf(const lex::LogicalLine& line, const std::string& fragment);

/*** IsValidVariable: `!` followed by an identifier. */
bool IsValidVariable(std::string_view name);

/*** ParseMixinArguments: `(a, b)` -> {"a", "b"}; empty -> {}; nullopt when not parenthesized. */
std::optional<std::vector<std::string>> ParseMixinArguments(std::string_view argString);

} // namespace sasstree::parse::rules
