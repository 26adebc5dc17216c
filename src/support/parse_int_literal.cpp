/***
 * Name: sasstree::support::ParseIntLiteralStrict
 * Purpose: Parse a base-10 integer without throwing; fail on extra tokens.
 * Inputs:
 *   - text: string view of the literal
 * Outputs:
 *   - out_val: parsed integer on success
 *   - err: optional error message on failure
 * Theory of Operation: Trim, take an optional sign, then parse digits strictly.
 */
#include "sasstree/support/parse.h"
#include "sasstree/support/parse_util.h"

#include <cctype>

namespace sasstree::support {

auto ParseIntLiteralStrict(std::string_view text, int& out_val, std::string* err) -> bool {
  TrimLeadingSpaces(text);
  bool is_negative = false;
  ConsumeSign(text, is_negative);
  if (text.empty() || std::isdigit(static_cast<unsigned char>(text[0])) == 0) {
    if (err != nullptr) {
      *err = "invalid integer literal";
    }
    return false;
  }
  long long value = 0;
  if (!ParseDigitsStrict(text, value, err)) {
    return false;
  }
  out_val = static_cast<int>(is_negative ? -value : value);
  return true;
}

}  // namespace sasstree::support
