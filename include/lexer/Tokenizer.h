/***
 * Name: sasstree::lex::Tokenizer
 * Purpose: Turn source text into logical lines with measured indentation depth.
 * Inputs:
 *   - An InputSource (string or file)
 *   - Number of the first physical line (for fragments parsed mid-document)
 * Outputs:
 *   - Ordered LogicalLine sequence with empty children.
 * Theory of Operation:
 *   Blank lines are dropped. The first leading-whitespace string seen becomes
 *   the document's indentation unit; every indented line must be an exact
 *   repetition of it and its depth is the repetition count. The first
 *   non-blank line may not be indented and the unit may not mix tabs and
 *   spaces. Violations throw exceptions::SyntaxError with the line number.
 */
#pragma once

#include <string>
#include <vector>
#include "lexer/InputSource.h"
#include "lexer/LogicalLine.h"

namespace sasstree::lex {

class Tokenizer {
public:
    explicit Tokenizer(int firstLine = 1) : firstLine_(firstLine) {}

    std::vector<LogicalLine> tabulate(InputSource& input) const;

    std::vector<LogicalLine> tabulate(const std::string& text, const std::string& name = "") const;

private:
    int firstLine_{1};

    static int measureDepth(const std::string& leading, const std::string& unit, int lineNo);
};

} // namespace sasstree::lex
