/***
 * Name: sasstree::support (parse_util)
 * Purpose: TrimLeadingSpaces, ConsumeSign and ParseDigitsStrict.
 */
#include "sasstree/support/parse_util.h"

#include <cctype>
#include <cstddef>
#include <limits>
#include <string>
#include <string_view>

namespace sasstree {
namespace support {

void TrimLeadingSpaces(std::string_view& text) {
  std::size_t index = 0;
  while (index < text.size() && std::isspace(static_cast<unsigned char>(text[index])) != 0) {
    ++index;
  }
  if (index > 0) {
    text.remove_prefix(index);
  }
}

auto ConsumeSign(std::string_view& text, bool& is_negative) -> bool {
  is_negative = false;
  if (!text.empty() && (text[0] == '+' || text[0] == '-')) {
    is_negative = (text[0] == '-');
    text.remove_prefix(1);
  }
  return true;
}

auto ParseDigitsStrict(std::string_view text, long long& value, std::string* err) -> bool {
  value = 0;
  constexpr int kBase10 = 10;
  for (const char digit_char : text) {
    if (std::isspace(static_cast<unsigned char>(digit_char)) != 0) {
      break;
    }
    if (std::isdigit(static_cast<unsigned char>(digit_char)) == 0) {
      if (err != nullptr) { *err = "invalid character in integer literal"; }
      return false;
    }
    value = (value * kBase10) + (digit_char - '0');
    if (value > std::numeric_limits<int>::max()) {
      if (err != nullptr) { *err = "integer overflow"; }
      return false;
    }
  }
  return true;
}

}  // namespace support
}  // namespace sasstree
