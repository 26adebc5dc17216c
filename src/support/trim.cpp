/***
 * Name: sasstree::support::Trim / RightTrim
 * Purpose: Strip ASCII whitespace from string views.
 */
#include "sasstree/support/text.h"

#include <string>
#include <string_view>

namespace sasstree::support {

namespace {
constexpr std::string_view kWhitespace = " \t\n\r\f\v";
} // namespace

std::string Trim(const std::string_view text) {
  const auto first = text.find_first_not_of(kWhitespace);
  if (first == std::string_view::npos) { return {}; }
  const auto last = text.find_last_not_of(kWhitespace);
  return std::string(text.substr(first, last - first + 1));
}

std::string RightTrim(const std::string_view text) {
  const auto last = text.find_last_not_of(kWhitespace);
  if (last == std::string_view::npos) { return {}; }
  return std::string(text.substr(0, last + 1));
}

bool EndsWith(const std::string_view text, const std::string_view suffix) {
  return text.size() >= suffix.size() && text.substr(text.size() - suffix.size()) == suffix;
}

}  // namespace sasstree::support
