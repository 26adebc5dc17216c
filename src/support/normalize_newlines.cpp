/***
 * Name: sasstree::support::NormalizeNewlines
 * Purpose: Fold every line-ending variant into a single \n.
 * Inputs: raw text
 * Outputs: copy using \n only
 */
#include "sasstree/support/text.h"

#include <string>
#include <string_view>

namespace sasstree::support {

std::string NormalizeNewlines(const std::string_view text) {
  std::string out;
  out.reserve(text.size());
  for (std::size_t i = 0; i < text.size(); ++i) {
    const char chr = text[i];
    if (chr != '\r') {
      out.push_back(chr);
      continue;
    }
    out.push_back('\n');
    if (i + 1 < text.size() && text[i + 1] == '\n') { ++i; }
  }
  return out;
}

}  // namespace sasstree::support
