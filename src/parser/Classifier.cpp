/***
 * Name: sasstree::parse::ClassifyLine
 * Purpose: Leading-character dispatch table.
 */
#include "parser/Classifier.h"

#include "parser/Rules.h"

namespace sasstree::parse {

namespace {
constexpr std::array<DispatchEntry, kDispatchEntries> kDispatch{{
    {':', &rules::OldAttribute},
    {'!', &rules::Variable},
    {'/', &rules::Comment},
    {'@', &rules::Directive},
    {'\\', &rules::Escape},
    {'=', &rules::MixinDefinition},
    {'+', &rules::MixinInclude},
}};
} // namespace

const std::array<DispatchEntry, kDispatchEntries>& DispatchTable() { return kDispatch; }

RuleFn SelectRule(std::string_view text) {
  if (!text.empty()) {
    for (const auto& entry : kDispatch) {
      if (entry.lead == text.front()) { return entry.rule; }
    }
  }
  return &rules::Plain;
}

ClassifyResult ClassifyLine(const LineInput& in) { return SelectRule(in.line.text)(in); }

} // namespace sasstree::parse
