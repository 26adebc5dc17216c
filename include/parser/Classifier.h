/***
 * Name: sasstree::parse (classifier)
 * Purpose: Table-driven dispatch from a line's leading character to its rule.
 * Theory of Operation: Entries are tried in table order and the first whose
 *   lead matches wins; lines matching no entry go to rules::Plain, which
 *   decides between a `name: value` attribute and a literal rule.
 */
#pragma once

#include <array>
#include <cstddef>
#include <string_view>
#include "parser/ClassifyResult.h"
#include "parser/ParseContext.h"

namespace sasstree::parse {

using RuleFn = ClassifyResult (*)(const LineInput&);

struct DispatchEntry {
    char lead;
    RuleFn rule;
};

inline constexpr std::size_t kDispatchEntries = 7;

const std::array<DispatchEntry, kDispatchEntries>& DispatchTable();

/*** SelectRule: Rule for a trimmed line of text. */
RuleFn SelectRule(std::string_view text);

/*** ClassifyLine: Run the selected rule on the line. */
ClassifyResult ClassifyLine(const LineInput& in);

} // namespace sasstree::parse
