/***
 * Name: sasstree::parse::StructureLines
 * Purpose: Nest the flat logical-line sequence by indentation depth.
 * Inputs:
 *   - lines: tokenizer output
 *   - cursor: index of the first line to consume
 * Outputs:
 *   - Sibling lines at the depth of lines[cursor], each with its children;
 *     cursor is left at the first line that belongs to an ancestor level.
 * Theory of Operation:
 *   Equal depth adds a sibling, depth+1 recurses into the last sibling, a
 *   shallower line ends the level. Jumping more than one level throws
 *   exceptions::SyntaxError naming the excess.
 */
#pragma once

#include <cstddef>
#include <vector>
#include "lexer/LogicalLine.h"

namespace sasstree::parse {

std::vector<lex::LogicalLine> StructureLines(std::vector<lex::LogicalLine>& lines, std::size_t& cursor);

/*** StructureLines: Convenience overload that structures the whole sequence. */
std::vector<lex::LogicalLine> StructureLines(std::vector<lex::LogicalLine> lines);

} // namespace sasstree::parse
