#include "cli/ParseArgsInternals.h"

#include "sasstree/exceptions/config_error.h"
#include "sasstree/support/parse.h"

namespace sasstree::cli::detail {

/***
 * Name: sasstree::cli::detail::parseLineValue
 * Purpose: Parse --line value; the first line number must be at least 1.
 */
int parseLineValue(std::string_view value) {
    int line = 0;
    std::string err;
    if (!support::ParseIntLiteralStrict(value, line, &err)) {
        throw exceptions::ConfigError("invalid --line value '" + std::string(value) + "': " + err);
    }
    if (line < 1) {
        throw exceptions::ConfigError("invalid --line value '" + std::string(value) + "': must be at least 1");
    }
    return line;
}

} // namespace sasstree::cli::detail
