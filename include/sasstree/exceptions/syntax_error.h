/***
 * Name: sasstree::exceptions::SyntaxError
 * Purpose: The single error shape raised by the parsing pipeline.
 * Inputs: Message and 1-based source line
 * Outputs: Exception object; what() renders `file:line: message` once a
 *   filename has been attached.
 * Theory of Operation: Raised at the first violation found by the tokenizer,
 *   tree structurer or classifier. The parser entry point attaches the
 *   filename and starting line when the error leaves the parse.
 */
#pragma once

#include <string>

#include "sasstree/exceptions/sasstree_exception.h"

namespace sasstree {
namespace exceptions {

class SyntaxError : public SasstreeException {
 public:
  explicit SyntaxError(std::string msg, int line = 0);

  /*** addMetadata: Attach filename (first one wins) and starting line. */
  void addMetadata(const std::string& filename, int startLine);

  const std::string& message() const noexcept { return raw_; }
  int line() const noexcept { return line_; }
  const std::string& filename() const noexcept { return filename_; }
  int startLine() const noexcept { return startLine_; }

 private:
  std::string raw_;
  int line_{0};
  std::string filename_{};
  int startLine_{1};
};

}  // namespace exceptions
}  // namespace sasstree
