/***
 * Name: sasstree::parse::patterns (impl)
 * Purpose: Hand-written scanners for attribute, variable, @for, @else and
 *   mixin lines.
 */
#include "parser/LinePatterns.h"

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace sasstree::parse::patterns {

namespace {

constexpr std::size_t npos = std::string_view::npos;

std::size_t skipSpaces(const std::string_view text, std::size_t pos) {
  while (pos < text.size() && IsSpace(text[pos])) { ++pos; }
  return pos;
}

bool atSpaceOrEnd(const std::string_view text, const std::size_t pos) {
  return pos >= text.size() || IsSpace(text[pos]);
}

bool isAlpha(const char chr) { return (chr >= 'a' && chr <= 'z') || (chr >= 'A' && chr <= 'Z'); }

bool isWordChar(const char chr) { return isAlpha(chr) || (chr >= '0' && chr <= '9') || chr == '_'; }

// End of the leading run of characters that are not whitespace and not in `stops`.
std::size_t runEnd(const std::string_view text, const std::size_t from, const std::string_view stops) {
  std::size_t pos = from;
  while (pos < text.size() && !IsSpace(text[pos]) && stops.find(text[pos]) == npos) { ++pos; }
  return pos;
}

Capture captureFrom(const std::string_view text, const std::size_t pos) {
  return Capture{std::string(text.substr(pos)), pos};
}

// (?:\s+|$)(.*) once the caller has checked the whitespace-or-end condition
Capture restAfterSpaces(const std::string_view text, const std::size_t pos) {
  return captureFrom(text, skipSpaces(text, pos));
}

// \s{min,}(.+)$ where the run may give its last character to the capture
std::optional<Capture> nonEmptyAfterSpaces(const std::string_view text, const std::size_t pos,
                                           const std::size_t minSpaces) {
  const std::size_t start = skipSpaces(text, pos);
  const std::size_t spaces = start - pos;
  if (spaces < minSpaces) { return std::nullopt; }
  if (start < text.size()) { return captureFrom(text, start); }
  if (spaces > minSpaces) { return captureFrom(text, text.size() - 1); }
  return std::nullopt;
}

std::optional<AttributeMatch> attributeTail(const std::string_view text, std::string name, std::string op,
                                            const std::size_t pos) {
  if (!atSpaceOrEnd(text, pos)) { return std::nullopt; }
  return AttributeMatch{std::move(name), std::move(op), restAfterSpaces(text, pos)};
}

// \s+(to|through)\s+(.+)$ starting at the whitespace at `pos`; `keyword` is
// the first non-space character after it.
std::optional<ForMatch> forTail(const std::string_view text, const std::size_t keyword) {
  for (const std::string_view word : {std::string_view("to"), std::string_view("through")}) {
    if (text.compare(keyword, word.size(), word) != 0) { continue; }
    if (auto to = nonEmptyAfterSpaces(text, keyword + word.size(), 1)) {
      ForMatch match;
      match.inclusive = word == "through";
      match.to = std::move(*to);
      return match;
    }
  }
  return std::nullopt;
}

// Position just past `\s+from`, or npos
std::size_t forFromEnd(const std::string_view text) {
  const std::size_t varEnd = runEnd(text, 0, "");
  if (varEnd == 0) { return npos; }
  const std::size_t from = skipSpaces(text, varEnd);
  if (from == varEnd || text.compare(from, 4, "from") != 0) { return npos; }
  return from + 4;
}

} // namespace

bool IsSpace(const char chr) {
  return chr == ' ' || chr == '\t' || chr == '\n' || chr == '\r' || chr == '\f' || chr == '\v';
}

std::optional<AttributeMatch> MatchOldAttribute(const std::string_view text) {
  if (text.empty() || text.front() != ':') { return std::nullopt; }
  const std::size_t nameEnd = runEnd(text, 1, "=:\"");
  if (nameEnd == 1) { return std::nullopt; }
  std::string name(text.substr(1, nameEnd - 1));
  const std::size_t eq = skipSpaces(text, nameEnd);
  if (eq < text.size() && text[eq] == '=' && atSpaceOrEnd(text, eq + 1)) {
    return AttributeMatch{std::move(name), "=", restAfterSpaces(text, eq + 1)};
  }
  return attributeTail(text, std::move(name), "", nameEnd);
}

std::optional<AttributeMatch> MatchNewAttribute(const std::string_view text) {
  const std::size_t nameEnd = runEnd(text, 0, "=:\"");
  if (nameEnd == 0) { return std::nullopt; }
  std::string name(text.substr(0, nameEnd));
  if (nameEnd < text.size() && text[nameEnd] == ':') {
    return attributeTail(text, std::move(name), ":", nameEnd + 1);
  }
  const std::size_t eq = skipSpaces(text, nameEnd);
  if (eq < text.size() && text[eq] == '=') {
    return attributeTail(text, std::move(name), std::string(text.substr(nameEnd, eq + 1 - nameEnd)), eq + 1);
  }
  return std::nullopt;
}

bool LooksLikeNewAttribute(const std::string_view text) {
  const std::size_t nameEnd = runEnd(text, 0, ":\"");
  for (std::size_t end = 1; end <= nameEnd; ++end) {
    const std::size_t op = skipSpaces(text, end);
    if (op < text.size() && (text[op] == '=' || text[op] == ':') && atSpaceOrEnd(text, op + 1)) { return true; }
  }
  return false;
}

std::optional<VariableMatch> MatchVariable(const std::string_view text) {
  if (text.size() < 2 || text[0] != '!' || !(isAlpha(text[1]) || text[1] == '_')) { return std::nullopt; }
  std::size_t nameEnd = 2;
  while (nameEnd < text.size() && isWordChar(text[nameEnd])) { ++nameEnd; }
  const std::size_t op = skipSpaces(text, nameEnd);
  bool guarded = false;
  std::size_t after = 0;
  if (text.compare(op, 3, "||=") == 0) {
    guarded = true;
    after = op + 3;
  } else if (op < text.size() && text[op] == '=') {
    after = op + 1;
  } else {
    return std::nullopt;
  }
  auto value = nonEmptyAfterSpaces(text, after, 0);
  if (!value) { return std::nullopt; }
  return VariableMatch{std::string(text.substr(1, nameEnd - 1)), guarded, std::move(*value)};
}

bool IsVariableName(const std::string_view text) {
  if (text.size() < 2 || text[0] != '!' || !(isAlpha(text[1]) || text[1] == '_')) { return false; }
  for (std::size_t i = 2; i < text.size(); ++i) {
    if (!isWordChar(text[i])) { return false; }
  }
  return true;
}

bool HasForVariable(const std::string_view text) { return !text.empty() && !IsSpace(text.front()); }

bool HasForStart(const std::string_view text) {
  const std::size_t fromEnd = forFromEnd(text);
  if (fromEnd == npos) { return false; }
  return nonEmptyAfterSpaces(text, fromEnd, 1).has_value();
}

std::optional<ForMatch> MatchFor(const std::string_view text) {
  const std::size_t fromEnd = forFromEnd(text);
  if (fromEnd == npos) { return std::nullopt; }
  const std::size_t start = skipSpaces(text, fromEnd);
  if (start == fromEnd) { return std::nullopt; }

  // (.+) before the keyword is greedy: try the rightmost split first.
  std::optional<ForMatch> match;
  std::size_t fromLen = 0;
  std::size_t nextSolid = text.size();
  std::size_t tried = npos;
  for (std::size_t split = text.size(); split-- > start + 1;) {
    if (!IsSpace(text[split])) {
      nextSolid = split;
      continue;
    }
    if (nextSolid == text.size() || nextSolid == tried) { continue; }
    tried = nextSolid;
    if ((match = forTail(text, nextSolid))) {
      fromLen = split - start;
      break;
    }
  }
  // The whitespace after `from` may give up characters: `from` + 1 space,
  // a one-space range start, then the whitespace before the keyword.
  std::size_t fromPos = start;
  if (!match && start - fromEnd >= 3 && start < text.size() && (match = forTail(text, start))) {
    fromPos = start - 2;
    fromLen = 1;
  }
  if (!match) { return std::nullopt; }
  match->var = std::string(text.substr(0, runEnd(text, 0, "")));
  match->from = Capture{std::string(text.substr(fromPos, fromLen)), fromPos};
  return match;
}

std::optional<Capture> MatchElseGuard(const std::string_view text) {
  if (text.compare(0, 2, "if") != 0) { return std::nullopt; }
  return nonEmptyAfterSpaces(text, 2, 1);
}

std::optional<MixinHead> MatchMixinHead(const std::string_view text, const char sigil) {
  if (text.empty() || text.front() != sigil) { return std::nullopt; }
  std::size_t nameStart = skipSpaces(text, 1);
  if (nameStart == text.size() || text[nameStart] == '(') {
    if (nameStart == 1) { return std::nullopt; }
    --nameStart;
  }
  std::size_t nameEnd = text.find('(', nameStart);
  if (nameEnd == npos) { nameEnd = text.size(); }
  return MixinHead{std::string(text.substr(nameStart, nameEnd - nameStart)), std::string(text.substr(nameEnd))};
}

} // namespace sasstree::parse::patterns
