/***
 * Name: sasstree::lex::Tokenizer
 * Purpose: Split source into indentation-measured logical lines.
 */
#include "lexer/Lexer.h"

#include "sasstree/exceptions/file_read_error.h"
#include "sasstree/exceptions/syntax_error.h"
#include "sasstree/support/fs.h"
#include "sasstree/support/text.h"

#include <cstddef>
#include <memory>
#include <sstream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace sasstree::lex {

namespace {
constexpr std::string_view kIndentChars = " \t\f\v";
} // namespace

// StringInput implementation
StringInput::StringInput(const std::string& text, std::string name)
  : name_(std::move(name)), in_(std::make_unique<std::istringstream>(support::NormalizeNewlines(text))) {}

bool StringInput::getline(std::string& out) {
  if (!in_ || !(*in_)) { return false; }
  if (!std::getline(*in_, out)) { return false; }
  return true;
}

// FileInput implementation
FileInput::FileInput(std::string path) : path_(std::move(path)), in_(nullptr) {
  std::string contents;
  std::string err;
  if (!support::ReadFile(path_, contents, err)) {
    throw exceptions::FileReadError(err);
  }
  in_ = std::make_unique<std::istringstream>(support::NormalizeNewlines(contents));
}

bool FileInput::getline(std::string& out) {
  if (!in_ || !(*in_)) { return false; }
  if (!std::getline(*in_, out)) { return false; }
  return true;
}

int Tokenizer::measureDepth(const std::string& leading, const std::string& unit, const int lineNo) {
  bool exact = (leading.size() % unit.size()) == 0;
  for (std::size_t pos = 0; exact && pos < leading.size(); pos += unit.size()) {
    exact = leading.compare(pos, unit.size(), unit) == 0;
  }
  if (!exact) {
    throw exceptions::SyntaxError(
        "Inconsistent indentation: " + support::HumanIndentation(leading, true) +
            " used for indentation, but the rest of the document was indented using " +
            support::HumanIndentation(unit) + ".",
        lineNo);
  }
  return static_cast<int>(leading.size() / unit.size());
}

// NOLINTNEXTLINE(readability-function-cognitive-complexity)
std::vector<LogicalLine> Tokenizer::tabulate(InputSource& input) const {
  std::vector<LogicalLine> lines;
  std::string unit;
  bool first = true;
  std::string raw;
  int lineNo = firstLine_ - 1;
  while (input.getline(raw)) {
    ++lineNo;
    const auto start = raw.find_first_not_of(kIndentChars);
    if (start == std::string::npos) { continue; }

    const std::string leading = raw.substr(0, start);
    if (!leading.empty()) {
      if (unit.empty()) { unit = leading; }
      if (first) {
        throw exceptions::SyntaxError("Indenting at the beginning of the document is illegal.", lineNo);
      }
      if (unit.find(' ') != std::string::npos && unit.find('\t') != std::string::npos) {
        throw exceptions::SyntaxError("Indentation can't use both tabs and spaces.", lineNo);
      }
    }
    first = false;

    LogicalLine line;
    line.text = support::RightTrim(std::string_view(raw).substr(start));
    line.index = lineNo;
    line.offset = static_cast<int>(start);
    line.filename = input.name();
    line.tabs = unit.empty() ? 0 : measureDepth(leading, unit, lineNo);
    lines.push_back(std::move(line));
  }
  return lines;
}

std::vector<LogicalLine> Tokenizer::tabulate(const std::string& text, const std::string& name) const {
  StringInput input(text, name);
  return tabulate(input);
}

} // namespace sasstree::lex
