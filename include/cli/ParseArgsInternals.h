/**
 * @file
 * @brief Declarations for sasstree CLI argument parsing helpers.
 */
#pragma once

#include <cstddef>
#include <string>
#include <string_view>

#include "cli/Options.h"
#include "cli/ColorMode.h"

namespace sasstree::cli::detail {

/** Return true if `arg` exactly matches the `flag`. */
bool isFlag(std::string_view arg, std::string_view flag);

/** Parse `--color=<value>` to ColorMode with default fallback. */
ColorMode parseColorValue(std::string_view value);

/** Parse `--style=<value>`; throws exceptions::ConfigError for an unknown style. */
config::OutputStyle parseStyleValue(std::string_view value);

/** Parse `--line=<N>`; throws exceptions::ConfigError unless N is a positive integer. */
int parseLineValue(std::string_view value);

/** Collect remaining argv items as input paths starting at index. */
void collectRemainingAsInputs(std::size_t startIndex, int argc, char** argv, Options& out);

/** Detect unknown option-like arguments beginning with '-' that aren't supported. */
bool isUnknownOptionArg(std::string_view arg);

/** Handle boolean, flag-only options like -h, --no-ast, --metrics, etc. */
bool applySimpleBoolFlags(std::string_view arg, Options& out);

/** Handle `--key=value` style options (load-path, style, line, log-path, color). */
bool applyPrefixedOptions(std::string_view arg, Options& out);

/** Handle `-I <dir>` / `-I<dir>`, consuming the next argv item when separate. */
bool handleLoadPathFlag(int& idx, int argc, char** argv, Options& out);

} // namespace sasstree::cli::detail
