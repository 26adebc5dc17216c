/***
 * Name: sasstree::support::HumanIndentation
 * Purpose: Describe an indentation string for diagnostics.
 * Inputs:
 *   - indentation: the leading whitespace
 *   - was: append " was"/" were" for use as a sentence subject
 * Outputs: "2 spaces", "1 tab was", or the quoted string when tabs and spaces mix
 */
#include "sasstree/support/text.h"

#include <string>
#include <string_view>

namespace sasstree::support {

static std::string quoted(const std::string_view text) {
  std::string out = "\"";
  for (const char chr : text) {
    if (chr == '\t') { out += "\\t"; }
    else { out.push_back(chr); }
  }
  out += "\"";
  return out;
}

std::string HumanIndentation(const std::string_view indentation, const bool was) {
  const bool hasTab = indentation.find('\t') != std::string_view::npos;
  const bool hasSpace = indentation.find(' ') != std::string_view::npos;
  if (hasTab && hasSpace) {
    return quoted(indentation) + (was ? " was" : "");
  }
  const char* noun = hasTab ? "tab" : "space";
  const bool singular = indentation.size() == 1;
  std::string out = std::to_string(indentation.size()) + " " + noun;
  if (!singular) { out += "s"; }
  if (was) { out += singular ? " was" : " were"; }
  return out;
}

}  // namespace sasstree::support
