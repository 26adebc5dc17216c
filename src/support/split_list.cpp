/***
 * Name: sasstree::support::SplitList
 * Purpose: Split a separated list, optionally dropping empty trailing fields.
 * Inputs:
 *   - text: the list
 *   - sep: separator character
 *   - keep_trailing: keep empty fields after the last non-empty one
 * Outputs: fields in order, untrimmed
 * Theory of Operation: Empty input yields no fields either way.
 */
#include "sasstree/support/text.h"

#include <string>
#include <string_view>
#include <vector>

namespace sasstree::support {

std::vector<std::string> SplitList(const std::string_view text, const char sep, const bool keep_trailing) {
  std::vector<std::string> fields;
  if (text.empty()) { return fields; }
  std::size_t start = 0;
  for (;;) {
    const auto pos = text.find(sep, start);
    if (pos == std::string_view::npos) {
      fields.emplace_back(text.substr(start));
      break;
    }
    fields.emplace_back(text.substr(start, pos - start));
    start = pos + 1;
  }
  if (!keep_trailing) {
    while (!fields.empty() && fields.back().empty()) { fields.pop_back(); }
  }
  return fields;
}

}  // namespace sasstree::support
