#include "cli/ParseArgsInternals.h"

namespace sasstree::cli::detail {

/***
 * Name: sasstree::cli::detail::parseColorValue
 * Purpose: Parse --color value into ColorMode with default.
 */
ColorMode parseColorValue(std::string_view value) {
    using enum sasstree::cli::ColorMode;
    if (value == "always") { return Always; }
    if (value == "never") { return Never; }
    return Auto;
}

} // namespace sasstree::cli::detail
