/***
 * Name: sasstree::parse::patterns
 * Purpose: Scanners for the fixed line shapes the classification rules accept.
 * Inputs: Trimmed line text (or a directive value)
 * Outputs: The captured pieces with their byte positions, or nullopt
 * Theory of Operation: Each scanner gives the same captures as the pattern
 *   named in its comment, including where that pattern would backtrack
 *   (greedy `.+` before a keyword, a whitespace run giving up its last
 *   character). Work is linear in the line length and uses no recursion, so
 *   very long values and selectors are safe.
 */
#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace sasstree::parse::patterns {

struct Capture {
    std::string text;
    std::size_t pos{0};
};

struct AttributeMatch {
    std::string name;
    std::string op; // "", "=", ":" or the spaces before "="
    Capture value;
};

struct VariableMatch {
    std::string name;
    bool guarded{false};
    Capture value;
};

struct ForMatch {
    std::string var;
    Capture from;
    bool inclusive{false};
    Capture to;
};

struct MixinHead {
    std::string name;
    std::string rest;
};

bool IsSpace(char chr);

// ^:([^\s=:"]+)\s*(=?)(?:\s+|$)(.*)
std::optional<AttributeMatch> MatchOldAttribute(std::string_view text);

// ^([^\s=:"]+)(\s*=|:)(?:\s+|$)(.*)
std::optional<AttributeMatch> MatchNewAttribute(std::string_view text);

// ^[^\s:"]+\s*[=:](\s|$)
bool LooksLikeNewAttribute(std::string_view text);

// ^!([a-zA-Z_]\w*)\s*((?:\|\|)?=)\s*(.+)
std::optional<VariableMatch> MatchVariable(std::string_view text);

// ^![a-zA-Z_]\w*$
bool IsVariableName(std::string_view text);

// ^([^\s]+)\s+from\s+(.+)\s+(to|through)\s+(.+)$
std::optional<ForMatch> MatchFor(std::string_view text);

// ^[^\s]+ and ^[^\s]+\s+from\s+.+ (used to name the missing piece)
bool HasForVariable(std::string_view text);
bool HasForStart(std::string_view text);

// ^if\s+(.+)
std::optional<Capture> MatchElseGuard(std::string_view text);

// ^=\s*([^(]+)(.*)$ and ^\+\s*([^(]+)(.*)$, sigil being '=' or '+'
std::optional<MixinHead> MatchMixinHead(std::string_view text, char sigil);

} // namespace sasstree::parse::patterns
