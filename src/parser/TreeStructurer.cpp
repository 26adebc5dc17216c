/***
 * Name: sasstree::parse::StructureLines
 * Purpose: Indentation-driven nesting of logical lines.
 */
#include "parser/TreeStructurer.h"

#include <string>
#include <utility>

#include "sasstree/exceptions/syntax_error.h"

namespace sasstree::parse {

std::vector<lex::LogicalLine> StructureLines(std::vector<lex::LogicalLine>& lines, std::size_t& cursor) {
  std::vector<lex::LogicalLine> siblings;
  if (cursor >= lines.size()) { return siblings; }
  const int depth = lines[cursor].tabs;
  while (cursor < lines.size()) {
    const int next = lines[cursor].tabs;
    if (next < depth) { break; }
    if (next == depth) {
      siblings.push_back(std::move(lines[cursor]));
      ++cursor;
      continue;
    }
    if (next > depth + 1) {
      throw exceptions::SyntaxError(
          "The line was indented " + std::to_string(next - depth) + " levels deeper than the previous line.",
          lines[cursor].index);
    }
    siblings.back().children = StructureLines(lines, cursor);
  }
  return siblings;
}

std::vector<lex::LogicalLine> StructureLines(std::vector<lex::LogicalLine> lines) {
  std::size_t cursor = 0;
  return StructureLines(lines, cursor);
}

} // namespace sasstree::parse
