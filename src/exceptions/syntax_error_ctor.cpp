/***
 * Name: sasstree::exceptions::SyntaxError::SyntaxError
 * Purpose: Construct a syntax error for a source line.
 * Inputs:
 *   - msg: diagnostic text
 *   - line: 1-based source line (0 when unknown)
 * Outputs: Initialized exception object
 */
#include "sasstree/exceptions/syntax_error.h"

#include <utility>

namespace sasstree::exceptions {

SyntaxError::SyntaxError(std::string msg, const int line)
    : SasstreeException(msg), raw_(std::move(msg)), line_(line) {}

}  // namespace sasstree::exceptions
