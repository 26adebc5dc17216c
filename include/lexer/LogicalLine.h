/**
 * Name: sasstree::lex::LogicalLine
 * Purpose: One non-blank source line reduced to trimmed text and nesting depth.
 */
#pragma once

#include <string>
#include <vector>

namespace sasstree::lex {

struct LogicalLine {
    std::string text{};   // trimmed
    int tabs{0};          // indentation depth in units
    int index{1};         // 1-based source line
    int offset{0};        // column of text within the physical line
    std::string filename{};
    std::vector<LogicalLine> children{}; // filled by parse::StructureLines
};

} // namespace sasstree::lex
