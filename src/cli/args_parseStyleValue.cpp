#include "cli/ParseArgsInternals.h"

#include "sasstree/exceptions/config_error.h"

namespace sasstree::cli::detail {

/***
 * Name: sasstree::cli::detail::parseStyleValue
 * Purpose: Parse --style value into config::OutputStyle.
 */
config::OutputStyle parseStyleValue(std::string_view value) {
    config::OutputStyle style{};
    if (!config::ParseOutputStyle(value, style)) {
        throw exceptions::ConfigError("unknown output style '" + std::string(value) + "'");
    }
    return style;
}

} // namespace sasstree::cli::detail
