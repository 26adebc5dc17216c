/***
 * Name: sasstree::support (text)
 * Purpose: Small string helpers shared by the tokenizer and the classifier.
 * Inputs: std::string / std::string_view
 * Outputs: Normalized or trimmed copies
 */
#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace sasstree {
namespace support {

/*** NormalizeNewlines: Rewrite \r\n and lone \r as \n. */
std::string NormalizeNewlines(std::string_view text);

/*** Trim: Copy of text without leading/trailing ASCII whitespace. */
std::string Trim(std::string_view text);

/*** RightTrim: Copy of text without trailing ASCII whitespace. */
std::string RightTrim(std::string_view text);

/*** EndsWith: Suffix test. */
bool EndsWith(std::string_view text, std::string_view suffix);

/*** SplitList: Split on `sep`; keep_trailing keeps empty trailing fields. */
std::vector<std::string> SplitList(std::string_view text, char sep, bool keep_trailing);

/*** HumanIndentation: "2 spaces", "1 tab", "3 spaces were", or the quoted string for mixed whitespace. */
std::string HumanIndentation(std::string_view indentation, bool was = false);

}  // namespace support
}  // namespace sasstree
