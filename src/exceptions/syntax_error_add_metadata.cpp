/***
 * Name: sasstree::exceptions::SyntaxError::addMetadata
 * Purpose: Attach the document filename and starting line to an error leaving the parser.
 * Inputs:
 *   - filename: document name (may be empty)
 *   - startLine: line number the parse started at
 * Outputs: Updated error; what() is rebuilt as `file:line: message`
 * Theory of Operation: The innermost document wins, so an error coming out of a
 *   nested parse keeps the filename it was first tagged with.
 */
#include "sasstree/exceptions/syntax_error.h"

#include <string>

namespace sasstree::exceptions {

void SyntaxError::addMetadata(const std::string& filename, const int startLine) {
  if (filename_.empty()) {
    filename_ = filename;
    startLine_ = startLine;
  }
  if (filename_.empty()) {
    message_ = raw_;
    return;
  }
  message_ = filename_ + ":" + std::to_string(line_) + ": " + raw_;
}

}  // namespace sasstree::exceptions
