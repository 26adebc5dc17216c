#include "cli/ParseArgsInternals.h"

namespace sasstree::cli::detail {
    /***
     * Name: sasstree::cli::detail::isUnknownOptionArg
     * Purpose: Option-like arguments that no handler accepted.
     */
    bool isUnknownOptionArg(const std::string_view arg) {
        return arg.size() > 1 && arg.front() == '-';
    }
} // namespace sasstree::cli::detail
