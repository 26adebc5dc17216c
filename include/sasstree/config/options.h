/***
 * Name: sasstree::config::Options
 * Purpose: Configuration bundle a document is parsed with.
 * Inputs: Set by callers (library users or the command line)
 * Outputs: Copied onto the AST root for the evaluation stage
 * Theory of Operation: Only loadPaths, filename and line affect parsing;
 *   style and precompiledLocation are carried through untouched.
 */
#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace sasstree::config {

enum class OutputStyle { Nested, Expanded, Compact, Compressed };

struct Options {
    OutputStyle style{OutputStyle::Nested};
    std::vector<std::string> loadPaths{"."};
    std::string precompiledLocation{"./.sass-cache"};
    std::optional<std::string> filename{};
    std::optional<int> line{};
};

const char* to_string(OutputStyle style);

/*** ParseOutputStyle: Map a style name to OutputStyle; false when unknown. */
bool ParseOutputStyle(std::string_view text, OutputStyle& out);

/*** ImportPaths: Directory of the current file (when known) followed by loadPaths. */
std::vector<std::string> ImportPaths(const Options& options);

} // namespace sasstree::config
